#include "profile_store.hpp"
#include "codec.hpp"
#include <fstream>
#include <stdexcept>

namespace replicator {

file_profile_store::file_profile_store(std::filesystem::path directory,
                                       std::shared_ptr<spdlog::logger> log)
    : m_directory(std::move(directory)), m_log(std::move(log))
{
    std::filesystem::create_directories(m_directory);
}

bool file_profile_store::valid_identity(const std::string& identity) {
    if (identity.empty() || identity.front() == '.') return false;
    for (char c : identity) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

std::filesystem::path file_profile_store::document_path(const std::string& identity) const {
    return m_directory / (identity + ".json");
}

std::optional<table> file_profile_store::load(const std::string& identity) {
    if (!valid_identity(identity)) {
        m_log->warn("profile_store: refusing invalid identity '{}'", identity);
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active.count(identity)) {
            m_log->warn("profile_store: '{}' is already loaded", identity);
            return std::nullopt;
        }
        m_active.emplace(identity, release_handler{});
    }

    auto file = document_path(identity);
    if (!std::filesystem::exists(file)) {
        m_log->info("profile_store: new profile '{}'", identity);
        return table{};
    }

    try {
        std::ifstream in(file);
        if (!in) throw std::runtime_error("cannot open " + file.string());
        auto doc = nlohmann::json::parse(in);
        auto data = table_from_json(doc);
        m_log->debug("profile_store: loaded '{}' from {}", identity, file.string());
        return data;
    } catch (const std::exception& e) {
        m_log->error("profile_store: failed to load '{}': {}", identity, e.what());
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(identity);
        return std::nullopt;
    }
}

void file_profile_store::release(const std::string& identity, const table& data) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active.erase(identity) == 0) {
            m_log->warn("profile_store: release of '{}' which holds no lock - not persisted", identity);
            return;
        }
    }

    // Write beside the target and rename so a crash never leaves half a document
    auto file = document_path(identity);
    auto tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("profile_store: cannot write " + tmp.string());
        out << to_json(data).dump(2);
        if (!out) throw std::runtime_error("profile_store: write failed for " + tmp.string());
    }
    std::filesystem::rename(tmp, file);

    m_log->debug("profile_store: released '{}' to {}", identity, file.string());
}

void file_profile_store::on_force_release(const std::string& identity, release_handler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(identity);
    if (it == m_active.end()) {
        m_log->warn("profile_store: release listener for '{}' which is not loaded", identity);
        return;
    }
    it->second = std::move(handler);
}

bool file_profile_store::force_release(const std::string& identity) {
    release_handler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_active.find(identity);
        if (it == m_active.end()) return false;
        handler = std::move(it->second);
        m_active.erase(it);
    }

    m_log->info("profile_store: forced release of '{}'", identity);
    if (handler) handler();
    return true;
}

bool file_profile_store::is_loaded(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.count(identity) > 0;
}

} // namespace replicator
