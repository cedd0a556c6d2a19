#ifndef AIMCPS_PLATFORM_ABI_HPP
#define AIMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace platform {

// Result of running a child process to completion.
struct ProcessResult {
    bool started = false;     // false: could not spawn (see error_message)
    bool timed_out = false;   // killed after the wall-clock limit
    int exit_code = -1;       // valid when started && !timed_out; 128+N for signal N
    std::string output;       // stdout and stderr interleaved, capped
    bool output_truncated = false;
    std::string error_message;
};

// Run argv[0] (looked up in PATH) with the given arguments in
// working_directory, capturing stdout+stderr. The child and its process group
// are killed with SIGKILL once timeout_seconds have elapsed. At most
// max_output_bytes of output are kept; the rest is read and discarded.
ProcessResult run_process(const std::vector<std::string> &argv, const std::string &working_directory,
                          int timeout_seconds, std::size_t max_output_bytes);

enum class ReadStatus {
    Ok,
    NotFound, // nothing exists at the path
    Failed,   // exists but is not a regular file, or cannot be opened or read
};

// Read up to max_bytes of a regular file (0 = no limit). truncated is set
// when the file is longer than max_bytes; error_message is filled on Failed.
ReadStatus read_file_contents(const std::string &file_path, std::size_t max_bytes, std::string &output_contents,
                              bool &truncated, std::string &error_message);

// Write content to file_path, creating missing parent directories.
// Returns false and fills error_message on failure.
bool write_file_contents(const std::string &file_path, const std::string &content, std::string &error_message);

// One regular file found by list_files().
struct FileEntry {
    std::string path;
    std::uintmax_t size = 0;
};

// Match a path relative to the search root against a glob pattern.
// Segments are matched with fnmatch(); a "**" segment matches zero or more
// directories.
bool glob_match(const std::string &pattern, const std::string &relative_path);

// Walk base_directory recursively, sort every path matching pattern, and
// return the regular files among the first `limit` matches.
std::vector<FileEntry> list_files(const std::string &base_directory, const std::string &pattern,
                                  std::size_t limit);

} // namespace platform

#endif // AIMCPS_PLATFORM_ABI_HPP
