/**
 * @file agent_catalog.cpp
 * @brief Directory-backed and in-memory agent catalogs.
 */

#include "sandbox/agent_catalog.hpp"

#include <fstream>
#include <mutex>
#include <sstream>

namespace sandbox_orchestrator {

bool is_valid_agent_id(std::string_view agent_id) noexcept {
    if (agent_id.empty() || agent_id.size() > 128) return false;
    for (char c : agent_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
               || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

// ─────────────────────────────────────────────
// DirectoryAgentCatalog
// ─────────────────────────────────────────────

DirectoryAgentCatalog::DirectoryAgentCatalog(std::filesystem::path dir, std::string entry_file)
    : dir_(std::move(dir)), entry_file_(std::move(entry_file)) {}

Result<AgentCode> DirectoryAgentCatalog::lookup(const AgentId& agent_id) const {
    if (!is_valid_agent_id(agent_id)) {
        return Error{ErrorCode::InvalidArgument, "Invalid agent id: " + agent_id};
    }

    auto path = dir_ / agent_id / entry_file_;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Agent not found: " + agent_id};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::Internal, "Failed to read " + path.string()};
    }
    return AgentCode{agent_id, buffer.str()};
}

// ─────────────────────────────────────────────
// InMemoryAgentCatalog
// ─────────────────────────────────────────────

void InMemoryAgentCatalog::put(AgentId agent_id, std::string source) {
    std::unique_lock lock(mutex_);
    agents_[std::move(agent_id)] = std::move(source);
}

bool InMemoryAgentCatalog::remove(const AgentId& agent_id) {
    std::unique_lock lock(mutex_);
    return agents_.erase(agent_id) > 0;
}

Result<AgentCode> InMemoryAgentCatalog::lookup(const AgentId& agent_id) const {
    std::shared_lock lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return Error{ErrorCode::NotFound, "Agent not found: " + agent_id};
    }
    return AgentCode{agent_id, it->second};
}

}  // namespace sandbox_orchestrator
