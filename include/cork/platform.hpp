#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Readers observe either the old or the new content, never a partial file.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// File Helpers
// ============================================================================

std::optional<std::string> read_file(const std::string& path);

std::optional<std::vector<uint8_t>> read_binary_file(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Create directories recursively (no-op if present)
bool create_directories(const std::string& path);

// ============================================================================
// String Helpers
// ============================================================================

std::string to_lower(const std::string& s);

std::string trim(const std::string& s);

// Final path component of either a POSIX or a Windows path ("C:\\a\\b.exe" -> "b.exe")
std::string portable_filename(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// $HOME, falling back to the current directory
std::string home_directory();

} // namespace cork
