#include "runtime/agent/registry.hpp"
#include <algorithm>
#include <regex>
#include <spdlog/spdlog.h>

namespace everos::runtime {

namespace {

size_t tier_slot(AgentTier tier) {
    return static_cast<size_t>(tier);
}

void erase_id(std::vector<std::string>& ids, const std::string& id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

} // namespace

nlohmann::json RegistryStats::to_json() const {
    nlohmann::json j;
    j["total"] = total;
    j["byTier"] = by_tier;
    j["byStatus"] = by_status;
    j["errors"] = errors;
    return j;
}

AgentRegistry::AgentRegistry(kernel::EventBus& bus) : bus_(bus) {
    // Bookkeeping: per-agent error counts from the agents' own diagnostics
    error_subscription_ = bus_.subscribe("agent:error", [this](const kernel::Event& event) {
        std::string agent_id = event.payload.is_object()
            ? event.payload.value("agentId", event.source)
            : event.source;
        std::lock_guard<std::mutex> lock(mutex_);
        if (agents_.count(agent_id)) {
            ++error_counts_[agent_id];
        }
    });
}

AgentRegistry::~AgentRegistry() {
    bus_.unsubscribe(error_subscription_);
    // The dispatcher may still hold a copy of the handler above
    bus_.wait_for_handlers();
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void AgentRegistry::register_agent(std::shared_ptr<Agent> agent) {
    if (!agent) {
        throw RegistryError("Cannot register a null agent");
    }

    const AgentConfig& config = agent->config();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (agents_.count(config.id)) {
            throw RegistryError("Agent " + config.id + " is already registered");
        }

        for (const auto& dep : config.dependencies) {
            if (!agents_.count(dep)) {
                throw RegistryError("Agent " + config.id + " depends on " + dep +
                                    ", which is not registered");
            }
        }

        agents_.emplace(config.id, AgentRecord{config, agent, std::chrono::system_clock::now()});
        registration_order_.push_back(config.id);
        tier_index_[tier_slot(config.tier)].push_back(config.id);
        if (!config.dependencies.empty()) {
            dependency_graph_[config.id] = config.dependencies;
        }
    }

    spdlog::info("Registered agent {} ({}, tier={})",
        config.id, config.name, agent_tier_to_string(config.tier));
    bus_.emit("registry:agent_registered", {
        {"agentId", config.id},
        {"tier", agent_tier_to_string(config.tier)},
        {"name", config.name}
    });
}

bool AgentRegistry::unregister_agent(const std::string& agent_id) {
    std::shared_ptr<Agent> agent;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(agent_id);
        if (it == agents_.end()) {
            return false;
        }

        auto dependents = dependents_locked(agent_id);
        if (!dependents.empty()) {
            std::string names;
            for (const auto& d : dependents) {
                if (!names.empty()) names += ", ";
                names += d;
            }
            throw RegistryError("Cannot unregister " + agent_id + ": agents " + names +
                                " depend on it");
        }

        agent = it->second.instance;
        erase_id(tier_index_[tier_slot(it->second.config.tier)], agent_id);
        erase_id(registration_order_, agent_id);
        dependency_graph_.erase(agent_id);
        error_counts_.erase(agent_id);
        agents_.erase(it);
    }

    // Outside the lock: stop() joins the tick thread, which may query us
    agent->stop();

    spdlog::info("Unregistered agent {}", agent_id);
    bus_.emit("registry:agent_unregistered", {{"agentId", agent_id}});
    return true;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::shared_ptr<Agent> AgentRegistry::get(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agent_id);
    return (it != agents_.end()) ? it->second.instance : nullptr;
}

std::optional<AgentConfig> AgentRegistry::get_config(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second.config;
}

std::vector<std::shared_ptr<Agent>> AgentRegistry::get_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Agent>> result;
    result.reserve(registration_order_.size());
    for (const auto& id : registration_order_) {
        result.push_back(agents_.at(id).instance);
    }
    return result;
}

std::vector<std::shared_ptr<Agent>> AgentRegistry::get_by_tier(AgentTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Agent>> result;
    for (const auto& id : tier_index_[tier_slot(tier)]) {
        result.push_back(agents_.at(id).instance);
    }
    return result;
}

std::vector<std::shared_ptr<Agent>> AgentRegistry::find(const AgentQuery& query) const {
    std::optional<std::regex> name_pattern;
    if (query.name) {
        name_pattern.emplace(*query.name, std::regex::icase);
    }

    std::vector<std::shared_ptr<Agent>> result;
    for (const auto& agent : get_all()) {
        const auto& config = agent->config();
        if (query.tier && config.tier != *query.tier) continue;
        if (query.status && agent->status() != *query.status) continue;
        if (name_pattern && !std::regex_search(config.name, *name_pattern)) continue;
        result.push_back(agent);
    }
    return result;
}

std::vector<std::string> AgentRegistry::get_dependents(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dependents_locked(agent_id);
}

std::vector<std::string> AgentRegistry::get_dependencies(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dependency_graph_.find(agent_id);
    if (it == dependency_graph_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> AgentRegistry::dependents_locked(const std::string& agent_id) const {
    std::vector<std::string> dependents;
    for (const auto& id : registration_order_) {
        auto it = dependency_graph_.find(id);
        if (it == dependency_graph_.end()) continue;
        const auto& deps = it->second;
        if (std::find(deps.begin(), deps.end(), agent_id) != deps.end()) {
            dependents.push_back(id);
        }
    }
    return dependents;
}

std::vector<std::string> AgentRegistry::start_order() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolve_start_order(registration_order_, dependency_graph_);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

std::vector<std::shared_ptr<Agent>> AgentRegistry::ordered_agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Agent>> ordered;
    for (const auto& id : resolve_start_order(registration_order_, dependency_graph_)) {
        ordered.push_back(agents_.at(id).instance);
    }
    return ordered;
}

void AgentRegistry::start_all() {
    auto ordered = ordered_agents();
    spdlog::info("Starting {} agent(s)...", ordered.size());

    size_t started = 0;
    for (const auto& agent : ordered) {
        if (!agent->config().enabled) {
            spdlog::info("Agent {} is disabled, not starting", agent->id());
            continue;
        }
        try {
            agent->start();
        } catch (const std::exception& e) {
            spdlog::error("Agent {} failed to start: {}", agent->id(), e.what());
        }
        if (agent->status() == AgentStatus::RUNNING) {
            ++started;
        } else {
            spdlog::warn("Agent {} is {} after start", agent->id(),
                agent_status_to_string(agent->status()));
        }
    }

    bus_.emit("registry:all_started", {{"count", ordered.size()}, {"running", started}});
}

void AgentRegistry::stop_all() {
    auto ordered = ordered_agents();
    std::reverse(ordered.begin(), ordered.end());
    spdlog::info("Stopping {} agent(s)...", ordered.size());

    for (const auto& agent : ordered) {
        try {
            agent->stop();
        } catch (const std::exception& e) {
            spdlog::error("Agent {} failed to stop: {}", agent->id(), e.what());
        }
    }

    bus_.emit("registry:all_stopped", {{"count", ordered.size()}});
}

void AgentRegistry::start_agent(const std::string& agent_id) {
    require(agent_id)->start();
}

void AgentRegistry::stop_agent(const std::string& agent_id) {
    require(agent_id)->stop();
}

std::shared_ptr<Agent> AgentRegistry::require(const std::string& agent_id) const {
    auto agent = get(agent_id);
    if (!agent) {
        throw RegistryError("Agent not found: " + agent_id);
    }
    return agent;
}

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

RegistryStats AgentRegistry::stats() const {
    RegistryStats stats;
    for (size_t i = 0; i < kAgentTierCount; ++i) {
        stats.by_tier[agent_tier_to_string(static_cast<AgentTier>(i))] = 0;
    }
    for (size_t i = 0; i < kAgentStatusCount; ++i) {
        stats.by_status[agent_status_to_string(static_cast<AgentStatus>(i))] = 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats.total = agents_.size();
    for (const auto& [id, record] : agents_) {
        stats.by_tier[agent_tier_to_string(record.config.tier)]++;
        stats.by_status[agent_status_to_string(record.instance->status())]++;
    }
    for (const auto& [id, count] : error_counts_) {
        stats.errors += count;
    }
    return stats;
}

uint64_t AgentRegistry::error_count(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(agent_id);
    return (it != error_counts_.end()) ? it->second : 0;
}

bool AgentRegistry::has(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(agent_id) > 0;
}

size_t AgentRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

} // namespace everos::runtime
