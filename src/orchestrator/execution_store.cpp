/**
 * @file execution_store.cpp
 * @brief ExecutionStore implementation.
 */

#include "orchestrator/execution_store.hpp"

#include <algorithm>
#include <utility>

namespace sandbox_orchestrator {

ExecutionStore::EntryPtr ExecutionStore::insert(ExecutionRecord record) {
    auto entry = std::make_shared<ExecutionEntry>();

    std::unique_lock lock(mutex_);
    if (entries_.contains(record.id)) return nullptr;

    entry->sequence = ++next_sequence_;
    entry->record = std::move(record);

    const auto& rec = entry->record;
    entries_.emplace(rec.id, entry);
    by_agent_[rec.agent_id].push_back(entry);
    if (rec.submission_id) {
        by_submission_[*rec.submission_id].push_back(entry);
    }
    return entry;
}

ExecutionStore::EntryPtr ExecutionStore::find(const ExecutionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<ExecutionRecord> ExecutionStore::list_by_agent(const AgentId& agent_id) const {
    std::vector<EntryPtr> entries;
    {
        std::shared_lock lock(mutex_);
        auto it = by_agent_.find(agent_id);
        if (it != by_agent_.end()) entries = it->second;
    }
    return snapshot_sorted(entries);
}

std::vector<ExecutionRecord> ExecutionStore::list_by_submission(const std::string& submission_id) const {
    std::vector<EntryPtr> entries;
    {
        std::shared_lock lock(mutex_);
        auto it = by_submission_.find(submission_id);
        if (it != by_submission_.end()) entries = it->second;
    }
    return snapshot_sorted(entries);
}

std::vector<ExecutionStore::EntryPtr> ExecutionStore::all() const {
    std::shared_lock lock(mutex_);
    std::vector<EntryPtr> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(entry);
    }
    return out;
}

size_t ExecutionStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::vector<ExecutionRecord> ExecutionStore::snapshot_sorted(
    const std::vector<EntryPtr>& entries) const {
    std::vector<std::pair<uint64_t, ExecutionRecord>> snapshots;
    snapshots.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        snapshots.emplace_back(entry->sequence, entry->record);
    }

    // Newest queued_at first; creation order breaks ties
    std::sort(snapshots.begin(), snapshots.end(), [](const auto& a, const auto& b) {
        if (a.second.queued_at != b.second.queued_at) {
            return a.second.queued_at > b.second.queued_at;
        }
        return a.first > b.first;
    });

    std::vector<ExecutionRecord> out;
    out.reserve(snapshots.size());
    for (auto& [seq, record] : snapshots) {
        out.push_back(std::move(record));
    }
    return out;
}

}  // namespace sandbox_orchestrator
