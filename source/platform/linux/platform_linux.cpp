#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <fnmatch.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace platform {

namespace fs = std::filesystem;

namespace {

// Poll interval for a child whose output pipe has already closed.
constexpr int kReapIntervalMilliseconds = 20;

// Closes a descriptor on scope exit.
class FileDescriptor {
public:
    explicit FileDescriptor(int descriptor = -1) : descriptor_(descriptor) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    int get() const { return descriptor_; }

    void reset(int descriptor = -1) {
        if (descriptor_ >= 0) {
            close(descriptor_);
        }
        descriptor_ = descriptor;
    }

private:
    int descriptor_;
};

// Runs in the forked child: never returns. Only async-signal-safe calls,
// since other threads of the parent may hold the allocator lock.
[[noreturn]] void exec_child(char *const *argv, const char *working_directory, int output_write,
                             int error_write) {
    setpgid(0, 0);

    dup2(output_write, STDOUT_FILENO);
    dup2(output_write, STDERR_FILENO);
    int null_input = open("/dev/null", O_RDONLY);
    if (null_input >= 0) {
        dup2(null_input, STDIN_FILENO);
    }

    if (working_directory[0] != '\0' && chdir(working_directory) != 0) {
        int failure = errno;
        ssize_t ignored = write(error_write, &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    execvp(argv[0], argv);

    // Only reached when exec failed; the error pipe is close-on-exec otherwise.
    int failure = errno;
    ssize_t ignored = write(error_write, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

void append_output(ProcessResult &result, const char *data, std::size_t length, std::size_t max_output_bytes) {
    if (result.output.size() >= max_output_bytes) {
        result.output_truncated = result.output_truncated || length > 0;
        return;
    }
    std::size_t room = max_output_bytes - result.output.size();
    if (length > room) {
        result.output.append(data, room);
        result.output_truncated = true;
        return;
    }
    result.output.append(data, length);
}

std::vector<std::string> split_segments(const std::string &path) {
    std::vector<std::string> segments;
    std::stringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
    }
    return segments;
}

bool match_segments(const std::vector<std::string> &pattern, std::size_t pattern_index,
                    const std::vector<std::string> &path, std::size_t path_index) {
    if (pattern_index == pattern.size()) {
        return path_index == path.size();
    }
    if (pattern[pattern_index] == "**") {
        // Zero directories, or consume one and stay on "**".
        if (match_segments(pattern, pattern_index + 1, path, path_index)) {
            return true;
        }
        return path_index < path.size() && match_segments(pattern, pattern_index, path, path_index + 1);
    }
    if (path_index == path.size()) {
        return false;
    }
    if (fnmatch(pattern[pattern_index].c_str(), path[path_index].c_str(), 0) != 0) {
        return false;
    }
    return match_segments(pattern, pattern_index + 1, path, path_index + 1);
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &argv, const std::string &working_directory,
                          int timeout_seconds, std::size_t max_output_bytes) {
    ProcessResult result;
    if (argv.empty() || argv.front().empty()) {
        result.error_message = "empty command";
        return result;
    }

    std::error_code directory_error;
    if (!working_directory.empty() && !fs::is_directory(working_directory, directory_error)) {
        result.error_message = "working directory not found: " + working_directory;
        return result;
    }

    std::vector<std::string> argv_strings = argv;
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    int output_pipe[2];
    if (pipe2(output_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    FileDescriptor output_read(output_pipe[0]);
    FileDescriptor output_write(output_pipe[1]);

    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    FileDescriptor error_read(error_pipe[0]);
    FileDescriptor error_write(error_pipe[1]);

    pid_t child_pid = fork();
    if (child_pid < 0) {
        result.error_message = "fork failed: " + std::string(strerror(errno));
        return result;
    }
    if (child_pid == 0) {
        exec_child(argv_pointers.data(), working_directory.c_str(), output_write.get(), error_write.get());
    }

    // Also make the group in the parent, so killpg works even if the child
    // has not reached setpgid() yet.
    setpgid(child_pid, child_pid);
    output_write.reset();
    error_write.reset();

    int exec_errno = 0;
    ssize_t error_bytes = read(error_read.get(), &exec_errno, sizeof(exec_errno));
    if (error_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(child_pid, &status, 0);
        result.error_message = "failed to start '" + argv.front() + "': " + std::string(strerror(exec_errno));
        return result;
    }
    result.started = true;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(timeout_seconds, 0));
    char buffer[8192];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd poll_descriptor;
        poll_descriptor.fd = output_read.get();
        poll_descriptor.events = POLLIN;
        poll_descriptor.revents = 0;
        int ready = poll(&poll_descriptor, 1, static_cast<int>(std::min<long long>(remaining, 1000)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_message = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t bytes_read = read(output_read.get(), buffer, sizeof(buffer));
        if (bytes_read < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            result.error_message = "read failed: " + std::string(strerror(errno));
            break;
        }
        if (bytes_read == 0) {
            break; // every writer closed the pipe
        }
        append_output(result, buffer, static_cast<std::size_t>(bytes_read), max_output_bytes);
    }

    // The child may close or redirect its output and keep running; the
    // deadline still applies until it has exited.
    int status = 0;
    bool reaped = false;
    while (!result.timed_out && result.error_message.empty()) {
        pid_t waited = waitpid(child_pid, &status, WNOHANG);
        if (waited == child_pid) {
            reaped = true;
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_message = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        poll(nullptr, 0, kReapIntervalMilliseconds);
    }

    if (!reaped) {
        if (result.timed_out || !result.error_message.empty()) {
            killpg(child_pid, SIGKILL);
        }
        while (waitpid(child_pid, &status, 0) < 0) {
            if (errno != EINTR) {
                result.error_message = "waitpid failed: " + std::string(strerror(errno));
                return result;
            }
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

ReadStatus read_file_contents(const std::string &file_path, std::size_t max_bytes, std::string &output_contents,
                              bool &truncated, std::string &error_message) {
    truncated = false;
    output_contents.clear();

    std::error_code status_error;
    fs::file_status status = fs::status(file_path, status_error);
    if (status.type() == fs::file_type::not_found) {
        return ReadStatus::NotFound;
    }
    if (status_error) {
        error_message = "cannot stat " + file_path + ": " + status_error.message();
        return ReadStatus::Failed;
    }
    if (!fs::is_regular_file(status)) {
        error_message = file_path + " is not a regular file";
        return ReadStatus::Failed;
    }

    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        error_message = "cannot open " + file_path + ": " + std::string(strerror(errno));
        return ReadStatus::Failed;
    }

    char buffer[65536];
    while (max_bytes == 0 || output_contents.size() < max_bytes) {
        std::size_t wanted = sizeof(buffer);
        if (max_bytes != 0) {
            wanted = std::min(wanted, max_bytes - output_contents.size());
        }
        file_stream.read(buffer, static_cast<std::streamsize>(wanted));
        output_contents.append(buffer, static_cast<std::size_t>(file_stream.gcount()));
        if (file_stream.bad()) {
            error_message = "read of " + file_path + " failed";
            return ReadStatus::Failed;
        }
        if (!file_stream) {
            break; // end of file
        }
    }

    if (file_stream && max_bytes != 0 && output_contents.size() == max_bytes) {
        truncated = file_stream.peek() != std::char_traits<char>::eof();
    }
    return ReadStatus::Ok;
}

bool write_file_contents(const std::string &file_path, const std::string &content, std::string &error_message) {
    fs::path target(file_path);
    std::error_code error;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), error);
        if (error) {
            error_message = "cannot create " + target.parent_path().string() + ": " + error.message();
            return false;
        }
    }

    std::ofstream file_stream(target, std::ios::binary | std::ios::trunc);
    if (!file_stream.is_open()) {
        error_message = "cannot open " + file_path + " for writing";
        return false;
    }
    file_stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    file_stream.close();
    if (file_stream.fail()) {
        error_message = "write to " + file_path + " failed";
        return false;
    }
    return true;
}

bool glob_match(const std::string &pattern, const std::string &relative_path) {
    return match_segments(split_segments(pattern), 0, split_segments(relative_path), 0);
}

std::vector<FileEntry> list_files(const std::string &base_directory, const std::string &pattern,
                                  std::size_t limit) {
    fs::path base(base_directory);
    std::vector<fs::path> matches;

    std::error_code error;
    fs::recursive_directory_iterator iterator(base, fs::directory_options::skip_permission_denied, error);
    fs::recursive_directory_iterator end_iterator;
    while (!error && iterator != end_iterator) {
        fs::path relative = iterator->path().lexically_relative(base);
        if (glob_match(pattern, relative.generic_string())) {
            matches.push_back(iterator->path());
        }
        iterator.increment(error);
    }

    std::sort(matches.begin(), matches.end());

    std::vector<FileEntry> files;
    for (std::size_t index = 0; index < matches.size() && index < limit; ++index) {
        std::error_code status_error;
        if (!fs::is_regular_file(matches[index], status_error)) {
            continue;
        }
        FileEntry entry;
        entry.path = matches[index].string();
        entry.size = fs::file_size(matches[index], status_error);
        if (status_error) {
            entry.size = 0;
        }
        files.push_back(entry);
    }
    return files;
}

} // namespace platform
