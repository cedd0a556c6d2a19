#ifndef AIMCPS_SHELL_WORDS_HPP
#define AIMCPS_SHELL_WORDS_HPP

// Split a command line into words with POSIX shell quoting rules:
// whitespace separates words, '...' is literal, "..." honours \\ \" \$ \`
// and backslash-newline, a bare backslash escapes the next character.
// No expansion, globbing or operators: "a|b" is one word.

#include <string>
#include <vector>

namespace shell_words {

struct SplitResult {
    bool success = false;
    std::vector<std::string> words;
    std::string error_message;
};

SplitResult split(const std::string &command_line);

} // namespace shell_words

#endif // AIMCPS_SHELL_WORDS_HPP
