#include "utils/shell_words.hpp"

#include <cctype>

namespace shell_words {

SplitResult split(const std::string &command_line) {
    enum class State { Between, Word, SingleQuoted, DoubleQuoted };

    SplitResult result;
    State state = State::Between;
    std::string current;
    bool word_started = false;

    for (std::size_t index = 0; index < command_line.size(); ++index) {
        char character = command_line[index];

        switch (state) {
        case State::Between:
        case State::Word:
            if (std::isspace(static_cast<unsigned char>(character))) {
                if (word_started) {
                    result.words.push_back(current);
                    current.clear();
                    word_started = false;
                }
                state = State::Between;
            } else if (character == '\'') {
                state = State::SingleQuoted;
                word_started = true;
            } else if (character == '"') {
                state = State::DoubleQuoted;
                word_started = true;
            } else if (character == '\\') {
                if (index + 1 >= command_line.size()) {
                    result.error_message = "No escaped character";
                    return result;
                }
                ++index;
                if (command_line[index] != '\n') {
                    current += command_line[index];
                    word_started = true;
                }
                state = word_started ? State::Word : State::Between;
            } else {
                current += character;
                word_started = true;
                state = State::Word;
            }
            break;

        case State::SingleQuoted:
            if (character == '\'') {
                state = State::Word;
            } else {
                current += character;
            }
            break;

        case State::DoubleQuoted:
            if (character == '"') {
                state = State::Word;
            } else if (character == '\\' && index + 1 < command_line.size()) {
                char next = command_line[index + 1];
                if (next == '\\' || next == '"' || next == '$' || next == '`') {
                    current += next;
                    ++index;
                } else if (next == '\n') {
                    ++index;
                } else {
                    current += character;
                }
            } else {
                current += character;
            }
            break;
        }
    }

    if (state == State::SingleQuoted || state == State::DoubleQuoted) {
        result.error_message = "No closing quotation";
        return result;
    }
    if (word_started) {
        result.words.push_back(current);
    }
    result.success = true;
    return result;
}

} // namespace shell_words
