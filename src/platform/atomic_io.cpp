#include "cork/platform.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cork {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned> temp_counter{0};

// Hidden sibling of the destination: ".<name>.<pid>.<n>.tmp"
std::string temp_path_for(const std::string& path) {
    fs::path target(path);
    std::string name = "." + target.filename().string() + "." + std::to_string(getpid()) + "." +
                       std::to_string(temp_counter++) + ".tmp";
    return (target.parent_path() / name).string();
}

bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = write(fd, data, left);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    std::string temp = temp_path_for(path);

    auto abandon = [&](const std::string& what) {
        result.error = what + " " + temp + ": " + strerror(errno);
        unlink(temp.c_str());
        return result;
    };

    int fd = open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        result.error = "cannot create " + temp + ": " + strerror(errno);
        return result;
    }

    bool written = write_all(fd, content) && fsync(fd) == 0;
    int saved_errno = errno;
    close(fd);
    if (!written) {
        errno = saved_errno;
        return abandon("cannot write");
    }

    if (rename(temp.c_str(), path.c_str()) != 0) {
        return abandon("cannot rename");
    }

    // Persist the directory entry as well; a failure here leaves valid content
    std::string dir = get_parent_directory(path);
    int dir_fd = open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
        fsync(dir_fd);
        close(dir_fd);
    }

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::vector<uint8_t>> read_binary_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    file.seekg(0, std::ios::end);
    auto end = file.tellg();
    if (end < 0) return std::nullopt;
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(end));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) return std::nullopt;

    return data;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string portable_filename(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (!val) return std::nullopt;
    return std::string(val);
}

std::string home_directory() {
    auto home = get_env("HOME");
    if (home && !home->empty()) return *home;
    return ".";
}

} // namespace cork
