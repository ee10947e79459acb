/**
 * BGCTL - Blue/Green Deployment Control Plane
 * ConfigStore - Implementation
 */

#include "store/config_store.hpp"
#include "store/env_record.hpp"
#include "core/errors.hpp"
#include "core/keys.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <stdexcept>

namespace bgctl::store {

// ============================================================================
// ConfigSnapshot Implementation
// ============================================================================

ConfigSnapshot::ConfigSnapshot(std::string content)
    : content_(std::move(content))
{
}

std::optional<std::string> ConfigSnapshot::find(std::string_view key) const {
    return lookup(content_, key);
}

std::string ConfigSnapshot::get(std::string_view key) const {
    auto value = find(key);
    if (!value) {
        throw core::NotFoundError(std::string(key));
    }
    return *value;
}

core::Pool ConfigSnapshot::active_pool() const {
    auto value = get(core::keys::ActivePool);
    auto pool = core::parse_pool(value);
    if (!pool) {
        throw core::MalformedConfigError(
            "ACTIVE_POOL holds '" + value + "', expected 'blue' or 'green'");
    }
    return *pool;
}

std::uint16_t ConfigSnapshot::port(std::string_view key) const {
    auto value = get(key);

    unsigned int parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size() || parsed == 0 || parsed > 65535) {
        throw core::MalformedConfigError(
            std::string(key) + " holds '" + value + "', expected a port number (1-65535)");
    }
    return static_cast<std::uint16_t>(parsed);
}

// ============================================================================
// ConfigStore Implementation
// ============================================================================

ConfigStore::ConfigStore(std::shared_ptr<StorageBackend> backend)
    : backend_(std::move(backend))
{
    if (!backend_) {
        throw std::invalid_argument("ConfigStore requires a storage backend");
    }
}

std::string ConfigStore::get(std::string_view key) const {
    return snapshot().get(key);
}

std::optional<std::string> ConfigStore::find(std::string_view key) const {
    return snapshot().find(key);
}

void ConfigStore::set(std::string_view key, std::string_view value) {
    validate_write(key, value);

    bool found = false;
    backend_->update([&](const std::string& current) -> std::optional<std::string> {
        auto updated = replace_value(current, key, value);
        found = updated.has_value();
        return updated;
    });

    if (!found) {
        throw core::NotFoundError(std::string(key));
    }
    spdlog::debug("Set {}={} in {}", key, value, backend_->describe());
}

bool ConfigStore::compare_and_set(std::string_view key, std::string_view expected,
                                  std::string_view value) {
    validate_write(key, value);

    bool found = false;
    bool written = backend_->update([&](const std::string& current) -> std::optional<std::string> {
        auto existing = lookup(current, key);
        found = existing.has_value();
        if (!existing || *existing != expected) {
            return std::nullopt;
        }
        return replace_value(current, key, value);
    });

    if (!found) {
        throw core::NotFoundError(std::string(key));
    }
    if (written) {
        spdlog::debug("Set {}={} (was {}) in {}", key, value, expected, backend_->describe());
    }
    return written;
}

ConfigSnapshot ConfigStore::snapshot() const {
    return ConfigSnapshot(backend_->read());
}

core::Pool ConfigStore::active_pool() const {
    return snapshot().active_pool();
}

std::uint16_t ConfigStore::port(std::string_view key) const {
    return snapshot().port(key);
}

void ConfigStore::validate_write(std::string_view key, std::string_view value) {
    if (!is_valid_key(key)) {
        throw std::invalid_argument("Invalid record key: '" + std::string(key) + "'");
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        throw std::invalid_argument("Record value for " + std::string(key) + " must be a single line");
    }
}

} // namespace bgctl::store
