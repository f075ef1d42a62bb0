/**
 * @file TypedCollection.hpp
 * @brief Typed read/insert/modify helpers over one RecordStore collection.
 */

#pragma once

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/value_objects/Timestamp.hpp"
#include "infrastructure/RecordCodec.hpp"
#include "infrastructure/RecordStore.hpp"

namespace staffledger::infrastructure {

/**
 * @class TypedCollection
 * @brief Shared plumbing for the file-backed repositories.
 *
 * Reads are unlocked snapshots. insert() and modify() run their whole
 * read -> compute -> write cycle inside the collection's exclusive section.
 * Rows that fail to decode are skipped on read (and logged) but are written
 * back untouched by insert() and modify().
 */
template <typename Entity>
class TypedCollection {
public:
    using Traits = RecordTraits<Entity>;

    explicit TypedCollection(std::shared_ptr<RecordStore> store) : m_store(std::move(store)) {}

    std::vector<Entity> loadAll() const {
        return decodeAll(m_store->read(Traits::kCollection));
    }

    template <typename Pred>
    std::vector<Entity> filter(Pred pred) const {
        std::vector<Entity> out;
        for (auto& entity : loadAll()) {
            if (pred(entity)) out.push_back(std::move(entity));
        }
        return out;
    }

    template <typename Pred>
    std::optional<Entity> findFirst(Pred pred) const {
        for (auto& entity : loadAll()) {
            if (pred(entity)) return std::move(entity);
        }
        return std::nullopt;
    }

    std::optional<Entity> findById(const std::string& id) const {
        return findFirst([&](const Entity& e) { return e.id == id; });
    }

    /**
     * @brief Appends build(currentRows). build validates against the current
     * rows and may throw; nothing is written in that case.
     */
    template <typename Build>
    Entity insert(Build&& build) {
        auto lock = m_store->scopedExclusive(Traits::kCollection);
        RecordList records = m_store->read(Traits::kCollection);

        const std::vector<Entity> current = decodeAll(records);
        Entity entity = build(current);
        records.push_back(Traits::Encode(entity));
        m_store->write(Traits::kCollection, records);
        return entity;
    }

    /**
     * @brief Applies mutate(entity) to the row with the given id, stamps
     * updatedAt and rewrites the collection. mutate may throw; nothing is
     * written in that case.
     * @return The new state, or std::nullopt when the id is unknown.
     */
    template <typename Mutate>
    std::optional<Entity> modify(const std::string& id, Mutate&& mutate) {
        auto lock = m_store->scopedExclusive(Traits::kCollection);
        RecordList records = m_store->read(Traits::kCollection);

        auto it = std::find_if(records.begin(), records.end(), [&](const Record& r) {
            auto field = r.find("id");
            return field != r.end() && field->is_string() && field->template get<std::string>() == id;
        });
        if (it == records.end()) {
            return std::nullopt;
        }

        Entity entity;
        try {
            entity = Traits::Decode(*it);
        } catch (const std::exception& e) {
            std::cerr << "[" << Traits::kCollection << "] Cannot update unreadable row " << id
                      << ": " << e.what() << std::endl;
            return std::nullopt;
        }

        mutate(entity);
        entity.updatedAt = std::max(domain::Now(), entity.updatedAt);

        *it = Traits::Encode(entity);
        m_store->write(Traits::kCollection, records);
        return entity;
    }

    RecordStore& store() { return *m_store; }

private:
    static std::vector<Entity> decodeAll(const RecordList& records) {
        std::vector<Entity> out;
        out.reserve(records.size());
        for (const auto& record : records) {
            try {
                out.push_back(Traits::Decode(record));
            } catch (const std::exception& e) {
                std::cerr << "[" << Traits::kCollection << "] Skipping malformed row: " << e.what() << std::endl;
            }
        }
        return out;
    }

    std::shared_ptr<RecordStore> m_store;
};

} // namespace staffledger::infrastructure
