/**
 * @file agent_catalog.hpp
 * @brief Resolves agent ids to the code that runs inside a sandbox.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sandbox_orchestrator {

struct AgentCode {
    AgentId agent_id;
    std::string source;
};

/// Agent ids are 1..128 characters of [A-Za-z0-9_-].
[[nodiscard]] bool is_valid_agent_id(std::string_view agent_id) noexcept;

/**
 * @brief Abstract agent code lookup.
 */
class IAgentCatalog {
public:
    virtual ~IAgentCatalog() = default;

    virtual Result<AgentCode> lookup(const AgentId& agent_id) const = 0;
};

/**
 * @brief Reads `<dir>/<agent_id>/<entry_file>` on every lookup.
 */
class DirectoryAgentCatalog final : public IAgentCatalog {
public:
    DirectoryAgentCatalog(std::filesystem::path dir, std::string entry_file);

    Result<AgentCode> lookup(const AgentId& agent_id) const override;

private:
    std::filesystem::path dir_;
    std::string entry_file_;
};

/**
 * @brief Catalog held in memory; used by tests and the demo mode.
 */
class InMemoryAgentCatalog final : public IAgentCatalog {
public:
    void put(AgentId agent_id, std::string source);
    bool remove(const AgentId& agent_id);

    Result<AgentCode> lookup(const AgentId& agent_id) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<AgentId, std::string> agents_;
};

}  // namespace sandbox_orchestrator
