/**
 * @file RecordStore.hpp
 * @brief Durable per-collection storage with atomic rewrite and corruption quarantine.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace staffledger::infrastructure {

using Record = nlohmann::json;
using RecordList = std::vector<Record>;

/**
 * @class RecordStore
 * @brief Stores one ordered sequence of flat JSON objects per named collection,
 * as <dataDir>/<collection>.json.
 *
 * Reads outside an exclusive section are best-effort snapshots. A mutation must
 * hold scopedExclusive(collection) across read -> compute -> write, otherwise
 * concurrent mutators can lose updates.
 *
 * Corruption policy: an artifact that cannot be parsed as a JSON array of
 * objects is renamed to <collection>.json.backup_<timestamp> and the collection
 * reads as empty. The quarantined rows are no longer visible to the service;
 * recovering them is a manual operation on the backup file. An artifact that a
 * commit replaced after it was read is never quarantined.
 */
class RecordStore {
public:
    /**
     * @class CollectionLock
     * @brief Exclusive section over one collection. Released on destruction.
     */
    class CollectionLock {
    public:
        explicit CollectionLock(std::mutex& mutex) : m_lock(mutex) {}
        CollectionLock(CollectionLock&&) noexcept = default;
        CollectionLock& operator=(CollectionLock&&) noexcept = default;

        bool ownsLock() const { return m_lock.owns_lock(); }

    private:
        std::unique_lock<std::mutex> m_lock;
    };

    /**
     * @param dataDir Directory holding the collection files. Created if missing.
     * @param prettyPrint Indent written JSON by two spaces.
     */
    explicit RecordStore(std::filesystem::path dataDir, bool prettyPrint = true);

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    /**
     * @brief Returns the current snapshot. Never throws: a missing artifact
     * reads as empty, a corrupt one is quarantined and reads as empty.
     */
    RecordList read(const std::string& collection);

    /**
     * @brief Replaces the whole collection (temp file -> rename).
     * @throws domain::StorageWriteError when serialization, the temp write or
     * the rename fails. The live artifact is untouched in that case.
     */
    void write(const std::string& collection, const RecordList& records);

    /** @brief Acquires the exclusive section for one collection. Blocks. */
    CollectionLock scopedExclusive(const std::string& collection);

    std::filesystem::path collectionPath(const std::string& collection) const;
    const std::filesystem::path& dataDir() const { return m_dataDir; }

private:
    std::mutex& mutexFor(const std::string& collection);
    std::mutex& commitMutexFor(const std::string& collection);

    /**
     * @brief Moves the artifact aside, but only while it still holds @p observed
     * (any content when nullopt).
     * @return false when a commit replaced the artifact after it was read.
     */
    bool quarantine(const std::string& collection,
                    const std::optional<std::string>& observed,
                    const std::string& reason);

    std::filesystem::path m_dataDir;
    bool m_prettyPrint;

    std::mutex m_registryMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_collectionMutexes;
    // Guards the rename of the live artifact, by commits and by quarantine.
    std::map<std::string, std::unique_ptr<std::mutex>> m_commitMutexes;
};

} // namespace staffledger::infrastructure
