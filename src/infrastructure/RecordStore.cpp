/**
 * @file RecordStore.cpp
 * @brief Implementation of RecordStore.
 */

#include "infrastructure/RecordStore.hpp"
#include "domain/Errors.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

namespace staffledger::infrastructure {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long long> g_tempCounter{0};

constexpr int kMaxReadAttempts = 3;

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<std::string> ReadWhole(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) return std::nullopt;
    return buffer.str();
}

std::optional<RecordList> ParseCollection(const std::string& content, std::string& reason) {
    nlohmann::json parsed = nlohmann::json::parse(content, nullptr, false);
    if (parsed.is_discarded()) {
        reason = "malformed JSON";
        return std::nullopt;
    }
    if (!parsed.is_array()) {
        reason = "top-level value is not an array";
        return std::nullopt;
    }

    RecordList records;
    records.reserve(parsed.size());
    for (auto& element : parsed) {
        if (!element.is_object()) {
            reason = "element is not an object";
            return std::nullopt;
        }
        records.push_back(std::move(element));
    }
    return records;
}

} // namespace

RecordStore::RecordStore(fs::path dataDir, bool prettyPrint)
    : m_dataDir(std::move(dataDir)), m_prettyPrint(prettyPrint) {
    std::error_code ec;
    fs::create_directories(m_dataDir, ec);
    if (ec) {
        std::cerr << "[RecordStore] Error creating data directory " << m_dataDir
                  << ": " << ec.message() << std::endl;
    }
}

fs::path RecordStore::collectionPath(const std::string& collection) const {
    return m_dataDir / (collection + ".json");
}

std::mutex& RecordStore::mutexFor(const std::string& collection) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto& slot = m_collectionMutexes[collection];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::mutex& RecordStore::commitMutexFor(const std::string& collection) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto& slot = m_commitMutexes[collection];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

RecordStore::CollectionLock RecordStore::scopedExclusive(const std::string& collection) {
    return CollectionLock(mutexFor(collection));
}

RecordList RecordStore::read(const std::string& collection) {
    fs::path path = collectionPath(collection);

    for (int attempt = 1;; ++attempt) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return {};
        }

        std::optional<std::string> content = ReadWhole(path);
        if (!content) {
            if (!fs::exists(path, ec)) return {};
            quarantine(collection, std::nullopt, "cannot read");
            return {};
        }

        if (IsBlank(*content)) {
            return {};
        }

        std::string reason;
        if (auto records = ParseCollection(*content, reason)) {
            return *records;
        }
        if (quarantine(collection, *content, reason) || attempt >= kMaxReadAttempts) {
            return {};
        }
        // A writer replaced the artifact after it was read. Read the new one.
    }
}

void RecordStore::write(const std::string& collection, const RecordList& records) {
    fs::path finalPath = collectionPath(collection);

    // Unique per operation: <collection>.json.<timestamp>.<n>.tmp
    fs::path tempPath = finalPath;
    tempPath += "." + domain::FormatTimestampCompact(domain::Now()) + "." +
                std::to_string(g_tempCounter.fetch_add(1)) + ".tmp";

    std::string payload;
    try {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& record : records) {
            array.push_back(record);
        }
        payload = m_prettyPrint ? array.dump(2) : array.dump();
    } catch (const nlohmann::json::exception& e) {
        throw domain::StorageWriteError("Cannot serialize collection " + collection + ": " + e.what());
    }

    std::error_code ec;
    fs::create_directories(m_dataDir, ec);
    if (ec) {
        throw domain::StorageWriteError("Cannot create data directory " + m_dataDir.string() + ": " + ec.message());
    }

    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::StorageWriteError("Cannot open temp file " + tempPath.string());
        }
        ofs << payload;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorageWriteError("Write failed for temp file " + tempPath.string());
        }
    }

    {
        std::lock_guard<std::mutex> commit(commitMutexFor(collection));
        fs::rename(tempPath, finalPath, ec);
    }
    if (ec) {
        std::string reason = ec.message();
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        std::cerr << "[RecordStore] Rename failed for " << collection << ": " << reason << std::endl;
        throw domain::StorageWriteError("Cannot replace collection " + collection + ": " + reason);
    }
}

bool RecordStore::quarantine(const std::string& collection,
                             const std::optional<std::string>& observed,
                             const std::string& reason) {
    fs::path path = collectionPath(collection);
    fs::path backup = path;
    backup += ".backup_" + domain::FormatTimestampCompact(domain::Now());

    std::error_code ec;
    {
        // Commits rename under the same mutex, so the artifact checked here is the one moved.
        std::lock_guard<std::mutex> commit(commitMutexFor(collection));
        if (observed && ReadWhole(path) != observed) {
            std::cerr << "[RecordStore] " << collection << " changed since it was read, not quarantining" << std::endl;
            return false;
        }
        fs::rename(path, backup, ec);
    }
    if (ec) {
        // Another reader may have moved it first.
        std::cerr << "[RecordStore] Could not quarantine " << collection << " (" << reason
                  << "): " << ec.message() << std::endl;
        return true;
    }
    std::cerr << "[RecordStore] Quarantined corrupt collection " << collection << " (" << reason
              << ") -> " << backup.filename().string() << std::endl;
    return true;
}

} // namespace staffledger::infrastructure
