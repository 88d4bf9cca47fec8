#pragma once
#include <array>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/event_bus.hpp"
#include "runtime/agent/agent.hpp"
#include "runtime/agent/dependency_graph.hpp"
#include "runtime/agent/types.hpp"

namespace everos::runtime {

struct AgentRecord {
    AgentConfig config;
    std::shared_ptr<Agent> instance;
    std::chrono::system_clock::time_point registered_at;
};

// Criteria for AgentRegistry::find; unset fields match everything
struct AgentQuery {
    std::optional<AgentTier> tier;
    std::optional<AgentStatus> status;
    std::optional<std::string> name;    // case-insensitive regex, searched in config.name
};

struct RegistryStats {
    size_t total = 0;
    std::map<std::string, size_t> by_tier;
    std::map<std::string, size_t> by_status;
    uint64_t errors = 0;

    nlohmann::json to_json() const;
};

// Agent registry - owns agents, their tier index and the dependency graph
class AgentRegistry {
public:
    explicit AgentRegistry(kernel::EventBus& bus);
    ~AgentRegistry();

    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    // Throws RegistryError on duplicate id or unregistered dependency
    void register_agent(std::shared_ptr<Agent> agent);

    // False for unknown ids. Throws RegistryError while dependents exist.
    bool unregister_agent(const std::string& agent_id);

    std::shared_ptr<Agent> get(const std::string& agent_id) const;
    std::optional<AgentConfig> get_config(const std::string& agent_id) const;
    std::vector<std::shared_ptr<Agent>> get_all() const;
    std::vector<std::shared_ptr<Agent>> get_by_tier(AgentTier tier) const;
    std::vector<std::shared_ptr<Agent>> find(const AgentQuery& query) const;

    std::vector<std::string> get_dependents(const std::string& agent_id) const;
    std::vector<std::string> get_dependencies(const std::string& agent_id) const;

    // Dependencies first; throws DependencyCycleError
    std::vector<std::string> start_order() const;

    // Sequential, in start order (reverse for stop). One failing agent does
    // not stop the rest.
    void start_all();
    void stop_all();

    // Throw RegistryError for unknown ids
    void start_agent(const std::string& agent_id);
    void stop_agent(const std::string& agent_id);

    RegistryStats stats() const;
    uint64_t error_count(const std::string& agent_id) const;
    bool has(const std::string& agent_id) const;
    size_t count() const;

private:
    std::vector<std::string> dependents_locked(const std::string& agent_id) const;
    std::shared_ptr<Agent> require(const std::string& agent_id) const;
    std::vector<std::shared_ptr<Agent>> ordered_agents() const;

    kernel::EventBus& bus_;
    kernel::SubscriptionId error_subscription_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, AgentRecord> agents_;
    std::vector<std::string> registration_order_;
    std::array<std::vector<std::string>, kAgentTierCount> tier_index_;
    DependencyGraph dependency_graph_;
    std::unordered_map<std::string, uint64_t> error_counts_;
};

} // namespace everos::runtime
