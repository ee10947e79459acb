/**
 * BGCTL - Blue/Green Deployment Control Plane
 * ConfigStore - Access to the persisted deployment record (ACTIVE_POOL, ports)
 */

#ifndef BGCTL_STORE_CONFIG_STORE_HPP
#define BGCTL_STORE_CONFIG_STORE_HPP

#include "core/pool.hpp"
#include "store/storage_backend.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bgctl::store {

/**
 * Immutable view of the record taken at one instant.
 * Used when an operation needs several values that must agree with each other.
 */
class ConfigSnapshot {
public:
    explicit ConfigSnapshot(std::string content);

    std::optional<std::string> find(std::string_view key) const;

    /**
     * @throws core::NotFoundError if the key is absent
     */
    std::string get(std::string_view key) const;

    /**
     * ACTIVE_POOL as a Pool
     * @throws core::NotFoundError, core::MalformedConfigError
     */
    core::Pool active_pool() const;

    /**
     * Port value in 1..65535
     * @throws core::NotFoundError, core::MalformedConfigError
     */
    std::uint16_t port(std::string_view key) const;

    const std::string& content() const noexcept { return content_; }

private:
    std::string content_;
};

/**
 * ConfigStore - single source of truth for the active pool and ports
 *
 * Every accessor re-reads the backend; callers that need a consistent
 * multi-key view opt into snapshot(). Writes go through the backend's
 * atomic read-modify-write so readers never see a half-written record.
 */
class ConfigStore {
public:
    explicit ConfigStore(std::shared_ptr<StorageBackend> backend);

    // Non-copyable
    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /**
     * @throws core::NotFoundError if the key is absent
     */
    std::string get(std::string_view key) const;

    std::optional<std::string> find(std::string_view key) const;

    /**
     * Replace the value of the first line holding `key`
     * @throws std::invalid_argument on a malformed key or a value with a newline
     * @throws core::NotFoundError if the key is absent (nothing is written)
     * @throws core::PersistError if the record cannot be written
     */
    void set(std::string_view key, std::string_view value);

    /**
     * Write `value` only if the current value equals `expected`
     * @return false (nothing written) if the current value differs
     */
    bool compare_and_set(std::string_view key, std::string_view expected, std::string_view value);

    ConfigSnapshot snapshot() const;

    core::Pool active_pool() const;
    std::uint16_t port(std::string_view key) const;

    bool exists() const { return backend_->exists(); }
    std::string location() const { return backend_->describe(); }

private:
    static void validate_write(std::string_view key, std::string_view value);

    std::shared_ptr<StorageBackend> backend_;
};

} // namespace bgctl::store

#endif // BGCTL_STORE_CONFIG_STORE_HPP
