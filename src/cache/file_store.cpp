#include "file_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace callgate {

namespace {

bool is_entry_file(const fs::directory_entry& de) {
    std::error_code ec;
    return de.is_regular_file(ec) && de.path().extension() == ".json";
}

// Parse one entry document; throws std::runtime_error if it is unusable.
CacheEntry read_entry(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("cannot open cache entry: " + path.string());

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object() ||
        !j.contains("fingerprint") || !j["fingerprint"].is_string() ||
        !j.contains("stored_at") || !j["stored_at"].is_number_integer() ||
        !j.contains("payload")) {
        throw std::runtime_error("corrupt cache entry: " + path.string());
    }

    CacheEntry entry;
    entry.fingerprint = j["fingerprint"].get<std::string>();
    entry.stored_at = j["stored_at"].get<uint64_t>();
    entry.payload = j["payload"];
    return entry;
}

} // anonymous namespace

FileCacheStore::FileCacheStore(std::string dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
        throw std::runtime_error("FileCacheStore: cannot create " + dir_ + ": " + ec.message());
}

std::string FileCacheStore::path_for(const std::string& fingerprint) const {
    return (fs::path(dir_) / (fingerprint + ".json")).string();
}

std::optional<CacheEntry> FileCacheStore::load(const std::string& fingerprint) {
    if (!valid_fingerprint(fingerprint)) return std::nullopt;

    fs::path path = path_for(fingerprint);
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    return read_entry(path);
}

void FileCacheStore::store(const CacheEntry& entry) {
    if (!valid_fingerprint(entry.fingerprint))
        throw CacheWriteError("invalid fingerprint: " + entry.fingerprint);

    nlohmann::json j = {
        {"fingerprint", entry.fingerprint},
        {"stored_at", entry.stored_at},
        {"payload", entry.payload}
    };
    std::string path = path_for(entry.fingerprint);
    if (!atomic_write_file(path, j.dump(2)))
        throw CacheWriteError("failed to write cache entry: " + path);
}

bool FileCacheStore::erase(const std::string& fingerprint) {
    if (!valid_fingerprint(fingerprint)) return false;
    std::error_code ec;
    return fs::remove(path_for(fingerprint), ec);
}

uint32_t FileCacheStore::erase_older_than(uint64_t cutoff) {
    uint32_t removed = 0;
    std::error_code ec;
    for (const auto& de : fs::directory_iterator(dir_, ec)) {
        if (!is_entry_file(de)) continue;
        try {
            CacheEntry entry = read_entry(de.path());
            if (entry.stored_at >= cutoff) continue;
        } catch (const std::runtime_error& e) {
            std::cerr << "[cache] Removing unreadable entry: " << e.what() << "\n";
        }
        std::error_code rm_ec;
        if (fs::remove(de.path(), rm_ec)) removed++;
    }
    if (ec)
        throw std::runtime_error("cannot list cache dir " + dir_ + ": " + ec.message());
    return removed;
}

uint32_t FileCacheStore::size() {
    uint32_t count = 0;
    std::error_code ec;
    for (const auto& de : fs::directory_iterator(dir_, ec)) {
        if (is_entry_file(de)) count++;
    }
    if (ec)
        throw std::runtime_error("cannot list cache dir " + dir_ + ": " + ec.message());
    return count;
}

void FileCacheStore::clear() {
    std::error_code ec;
    for (const auto& de : fs::directory_iterator(dir_, ec)) {
        if (!is_entry_file(de)) continue;
        std::error_code rm_ec;
        fs::remove(de.path(), rm_ec);
        if (rm_ec)
            throw CacheWriteError("cannot remove " + de.path().string() + ": " + rm_ec.message());
    }
    if (ec)
        throw std::runtime_error("cannot list cache dir " + dir_ + ": " + ec.message());
}

} // namespace callgate
