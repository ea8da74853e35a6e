#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vdl {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components with a single separator, never by raw concatenation
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path exists (does not follow a dangling symlink)
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// Check if a path is a symlink
bool is_symlink(const std::string& path);

// Resolve every symlink in an existing path
std::optional<std::string> canonical_path(const std::string& path);

// Resolve symlinks in the existing prefix of a path, lexically normalize the rest
std::optional<std::string> weakly_canonical_path(const std::string& path);

// Remove a file
bool remove_file(const std::string& path);

// Read a whole file, nullopt when it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Directories
// ============================================================================

struct DirectoryResult {
    bool ok = false;
    std::string error;
    int error_code = 0;   // errno of the failing call, 0 on success
};

// Create a directory and any missing parents with mode 0755.
// A component that already exists (including one created concurrently by
// another process) counts as success as long as it is a directory.
DirectoryResult ensure_directory(const std::string& path);

// Check that the current process may create entries in a directory
DirectoryResult check_writable(const std::string& path);

// True when others may write to the directory and the sticky bit is not set
bool is_world_writable(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Home directory of the current user ($HOME, then the password database)
std::optional<std::string> get_home_directory();

// Home directory of a named user
std::optional<std::string> get_user_home_directory(const std::string& user);

// ============================================================================
// Process Execution
// ============================================================================

struct ProcessResult {
    bool ok = false;          // process was spawned and reaped
    int exit_code = -1;
    bool timed_out = false;
    std::string out;          // captured stdout
    std::string err;          // captured stderr
    std::string error;        // spawn/wait failure description
};

// Run argv[0] (looked up on PATH) with the given arguments, no shell involved.
// timeout_seconds <= 0 waits indefinitely; on timeout the child is killed.
ProcessResult run_process(const std::vector<std::string>& argv, int timeout_seconds = 0);

} // namespace vdl
