/**
 * @file execution_store.hpp
 * @brief In-memory execution records with per-record locking.
 *
 * The map is guarded by a shared_mutex that is held only for lookups and
 * inserts; each record carries its own mutex, so transitions on unrelated
 * executions never contend.
 */

#pragma once

#include "core/types.hpp"
#include "sandbox/warm_pool.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief A record plus the state of its in-flight attempt.
 *
 * All fields are guarded by @c mutex. The attempt number is the record's
 * retry_count; transitions carry it so that a stale worker or watchdog can
 * never touch a later attempt.
 */
struct ExecutionEntry {
    mutable std::mutex mutex;
    uint64_t sequence{0};
    ExecutionRecord record;
    InstanceHandle instance;      ///< Lease held while initializing/running
    std::stop_source stop;        ///< Cooperative stop for the current attempt
};

class ExecutionStore {
public:
    using EntryPtr = std::shared_ptr<ExecutionEntry>;

    /// Take ownership of a new record. Returns nullptr if the id already exists.
    EntryPtr insert(ExecutionRecord record);

    [[nodiscard]] EntryPtr find(const ExecutionId& id) const;

    /// Snapshots ordered by queued_at, most recent first.
    [[nodiscard]] std::vector<ExecutionRecord> list_by_agent(const AgentId& agent_id) const;
    [[nodiscard]] std::vector<ExecutionRecord> list_by_submission(const std::string& submission_id) const;

    [[nodiscard]] std::vector<EntryPtr> all() const;
    [[nodiscard]] size_t size() const;

private:
    [[nodiscard]] std::vector<ExecutionRecord> snapshot_sorted(
        const std::vector<EntryPtr>& entries) const;

    mutable std::shared_mutex mutex_;
    uint64_t next_sequence_{0};
    std::unordered_map<ExecutionId, EntryPtr> entries_;
    std::unordered_map<AgentId, std::vector<EntryPtr>> by_agent_;
    std::unordered_map<std::string, std::vector<EntryPtr>> by_submission_;
};

}  // namespace sandbox_orchestrator
