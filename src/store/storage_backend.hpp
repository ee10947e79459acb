/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Storage backends for the deployment record
 */

#ifndef BGCTL_STORE_STORAGE_BACKEND_HPP
#define BGCTL_STORE_STORAGE_BACKEND_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace bgctl::store {

/**
 * Mutation applied under the backend's exclusive write lock.
 * Receives the current content; returns the replacement content, or
 * std::nullopt to leave the record untouched.
 */
using RecordMutator = std::function<std::optional<std::string>(const std::string&)>;

/**
 * Storage backend - holds the raw text of the deployment record
 *
 * Contract:
 * - read() always returns the latest committed content (no caching)
 * - update() is a read-modify-write that is atomic with respect to both
 *   readers (never observe a partial record) and other writers
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /**
     * @throws core::PersistError if the record cannot be read
     */
    virtual std::string read() const = 0;

    /**
     * @return true if the mutator produced new content and it was committed
     * @throws core::PersistError if the record cannot be locked or written
     */
    virtual bool update(const RecordMutator& mutator) = 0;

    virtual bool exists() const = 0;

    /**
     * Human-readable location for log messages
     */
    virtual std::string describe() const = 0;
};

/**
 * File backend - write-to-temp-then-rename with an advisory lock
 *
 * Writers take a process-local mutex and an exclusive flock() on a sidecar
 * `<file>.lock`, so concurrent bgctl processes serialize their updates.
 * Readers never lock; rename() guarantees they see either the old or the
 * new record.
 */
class FileBackend : public StorageBackend {
public:
    explicit FileBackend(std::filesystem::path path);

    // Non-copyable
    FileBackend(const FileBackend&) = delete;
    FileBackend& operator=(const FileBackend&) = delete;

    std::string read() const override;
    bool update(const RecordMutator& mutator) override;
    bool exists() const override;
    std::string describe() const override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void write_atomically(const std::string& content);

    std::filesystem::path path_;
    std::filesystem::path lock_path_;
    std::mutex write_mutex_;
};

/**
 * In-memory backend - same contract, no persistence
 */
class MemoryBackend : public StorageBackend {
public:
    explicit MemoryBackend(std::string content = {});

    std::string read() const override;
    bool update(const RecordMutator& mutator) override;
    bool exists() const override { return true; }
    std::string describe() const override { return "<memory>"; }

    /**
     * Number of committed updates (for observing write behavior)
     */
    std::size_t write_count() const;

private:
    mutable std::mutex mutex_;
    std::string content_;
    std::size_t writes_{0};
};

} // namespace bgctl::store

#endif // BGCTL_STORE_STORAGE_BACKEND_HPP
