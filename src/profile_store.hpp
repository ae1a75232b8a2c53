#pragma once

#include "value.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace replicator {

// Persistent, lockable storage of authoritative documents.
// At most one active load per identity; a load that fails is not retried.
class profile_store {
public:
    using release_handler = std::function<void()>;

    virtual ~profile_store() = default;

    // Load and lock the document. std::nullopt if it cannot be produced.
    virtual std::optional<table> load(const std::string& identity) = 0;

    // Persist `data` and unlock. Throws std::runtime_error if persisting fails.
    virtual void release(const std::string& identity, const table& data) = 0;

    // `handler` runs if the lock is taken away without release() being called.
    virtual void on_force_release(const std::string& identity, release_handler handler) = 0;
};

// One JSON document per identity: <directory>/<identity>.json
// A missing file loads as an empty table.
class file_profile_store : public profile_store {
public:
    file_profile_store(std::filesystem::path directory, std::shared_ptr<spdlog::logger> log);

    std::optional<table> load(const std::string& identity) override;
    void release(const std::string& identity, const table& data) override;
    void on_force_release(const std::string& identity, release_handler handler) override;

    // Drop the lock held for `identity` without persisting, and fire its
    // release handler. Returns false if the identity is not loaded.
    bool force_release(const std::string& identity);

    bool is_loaded(const std::string& identity) const;

    // Identities become file names, so only [A-Za-z0-9_.-] without a leading dot.
    static bool valid_identity(const std::string& identity);

private:
    std::filesystem::path document_path(const std::string& identity) const;

    std::filesystem::path m_directory;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    // identity -> release handler (empty until on_force_release)
    std::unordered_map<std::string, release_handler> m_active;
};

} // namespace replicator
