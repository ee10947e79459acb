/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Storage backends - Implementation
 */

#include "store/storage_backend.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace bgctl::store {

namespace {

std::string errno_message(const std::string& what, const std::filesystem::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

/**
 * RAII exclusive flock() on a sidecar lock file
 */
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw core::PersistError(errno_message("Cannot open lock file", path));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            auto message = errno_message("Cannot lock", path);
            ::close(fd_);
            throw core::PersistError(message);
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_{-1};
};

void write_all(int fd, const std::string& content, const std::filesystem::path& path) {
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        auto written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw core::PersistError(errno_message("Cannot write", path));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

} // namespace

// ============================================================================
// FileBackend Implementation
// ============================================================================

FileBackend::FileBackend(std::filesystem::path path)
    : path_(std::move(path))
    , lock_path_(path_.string() + ".lock")
{
}

std::string FileBackend::read() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw core::PersistError("Cannot open deployment record: " + path_.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw core::PersistError("Cannot read deployment record: " + path_.string());
    }
    return content.str();
}

bool FileBackend::update(const RecordMutator& mutator) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    FileLock file_lock(lock_path_);

    auto current = read();
    auto updated = mutator(current);
    if (!updated) {
        return false;
    }

    write_atomically(*updated);
    spdlog::debug("Committed deployment record {} ({} bytes)", path_.string(), updated->size());
    return true;
}

bool FileBackend::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

std::string FileBackend::describe() const {
    return path_.string();
}

void FileBackend::write_atomically(const std::string& content) {
    auto dir = path_.has_parent_path() ? path_.parent_path() : std::filesystem::path(".");
    auto tmp_path = dir / ("." + path_.filename().string() + ".tmp." + std::to_string(::getpid()));

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw core::PersistError(errno_message("Cannot create temporary record", tmp_path));
    }

    try {
        write_all(fd, content, tmp_path);
        if (::fsync(fd) != 0) {
            throw core::PersistError(errno_message("Cannot sync", tmp_path));
        }
    } catch (...) {
        ::close(fd);
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw;
    }

    if (::close(fd) != 0) {
        auto message = errno_message("Cannot close", tmp_path);
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw core::PersistError(message);
    }

    std::error_code ec;
    auto status = std::filesystem::status(path_, ec);
    if (!ec) {
        std::filesystem::permissions(tmp_path, status.permissions(), ec);
        if (ec) {
            spdlog::warn("Could not preserve permissions of {}: {}", path_.string(), ec.message());
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw core::PersistError("Cannot replace " + path_.string() + ": " + ec.message());
    }
}

// ============================================================================
// MemoryBackend Implementation
// ============================================================================

MemoryBackend::MemoryBackend(std::string content)
    : content_(std::move(content))
{
}

std::string MemoryBackend::read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return content_;
}

bool MemoryBackend::update(const RecordMutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto updated = mutator(content_);
    if (!updated) {
        return false;
    }
    content_ = std::move(*updated);
    ++writes_;
    return true;
}

std::size_t MemoryBackend::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

} // namespace bgctl::store
