#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "models/HistoryEntry.hpp"

namespace alphapunch {

/**
 * @class HistoryCache
 * @brief Most-recent-first record of completed generations.
 *
 * Holds at most capacity() entries; pushing onto a full cache evicts the
 * oldest. Readers always get copies, so eviction never invalidates anything
 * a caller holds. Not thread-safe on its own; GenerationOrchestrator guards it.
 */
class HistoryCache
{
public:
    static constexpr std::size_t kDefaultCapacity = 10;

    explicit HistoryCache(std::size_t capacity = kDefaultCapacity);

    /**
     * @brief Inserts @p entry at the front, dropping the back entry if over capacity.
     */
    void push(HistoryEntry entry);

    /**
     * @brief Snapshot of all entries, most recent first.
     */
    std::vector<HistoryEntry> list() const;

    /**
     * @brief Copy of the entry with @p id, or nullopt if it is not (or no longer) cached.
     */
    std::optional<HistoryEntry> select(const std::string& id) const;

    /**
     * @brief Fresh id, unique for the lifetime of this cache.
     * @param timestamp Creation time in ms; used as the readable prefix.
     */
    std::string nextId(std::int64_t timestamp);

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

private:
    std::size_t capacity_;
    std::uint64_t counter_ {0};
    std::deque<HistoryEntry> entries_;
};

}
