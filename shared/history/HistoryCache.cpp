#include "HistoryCache.hpp"

#include <algorithm>
#include <utility>

namespace alphapunch {

HistoryCache::HistoryCache(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity))
{
}

void HistoryCache::push(HistoryEntry entry)
{
    entries_.push_front(std::move(entry));
    while (entries_.size() > capacity_) entries_.pop_back();
}

std::vector<HistoryEntry> HistoryCache::list() const
{
    return std::vector<HistoryEntry>(entries_.begin(), entries_.end());
}

std::optional<HistoryEntry> HistoryCache::select(const std::string& id) const
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const HistoryEntry& e) { return e.id == id; });
    if (it == entries_.end()) return std::nullopt;
    return *it;
}

std::string HistoryCache::nextId(std::int64_t timestamp)
{
    return std::to_string(timestamp) + "-" + std::to_string(++counter_);
}

}
