#include <doctest/doctest.h>

#include <algorithm>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "kernel/event_bus.hpp"
#include "runtime/agent/dependency_graph.hpp"
#include "runtime/agent/registry.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using everos::kernel::EventBus;
using everos::kernel::HistoryFilter;
using everos::runtime::AgentQuery;
using everos::runtime::AgentRegistry;
using everos::runtime::AgentStatus;
using everos::runtime::AgentTier;
using everos::runtime::DependencyCycleError;
using everos::runtime::RegistryError;
using everos::test::ScriptedAgent;
using everos::test::make_config;

namespace {

// Thread-safe record of lifecycle hook calls
class Journal {
public:
    void add(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t position(const std::string& entry) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::find(entries_.begin(), entries_.end(), entry) - entries_.begin());
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

std::shared_ptr<ScriptedAgent> journaled(EventBus& bus, Journal& journal, const std::string& id,
                                         std::vector<std::string> deps = {},
                                         AgentTier tier = AgentTier::SPECIALIZED) {
    auto agent = std::make_shared<ScriptedAgent>(make_config(id, std::move(deps), 0, tier), bus);
    agent->start_hook = [&journal, id](ScriptedAgent&) {
        journal.add("begin:" + id);
        std::this_thread::sleep_for(2ms);
        journal.add("end:" + id);
    };
    agent->stop_hook = [&journal, id](ScriptedAgent&) { journal.add("stop:" + id); };
    return agent;
}

} // namespace

TEST_CASE("AgentRegistry starts a dependency before its dependent") {
    EventBus bus;
    Journal journal;
    AgentRegistry registry(bus);
    registry.register_agent(journaled(bus, journal, "base"));
    registry.register_agent(journaled(bus, journal, "derived", {"base"}));

    registry.start_all();

    CHECK(journal.entries() ==
          std::vector<std::string>{"begin:base", "end:base", "begin:derived", "end:derived"});
    CHECK(registry.get("base")->status() == AgentStatus::RUNNING);
    CHECK(registry.get("derived")->status() == AgentStatus::RUNNING);

    registry.stop_all();
    CHECK(journal.position("stop:derived") < journal.position("stop:base"));
}

TEST_CASE("AgentRegistry start order is a stable topological sort") {
    EventBus bus;
    Journal journal;
    AgentRegistry registry(bus);
    registry.register_agent(journaled(bus, journal, "clock"));
    registry.register_agent(journaled(bus, journal, "market"));
    registry.register_agent(journaled(bus, journal, "sensor", {"clock"}));
    registry.register_agent(journaled(bus, journal, "trader", {"market", "sensor"}));
    registry.register_agent(journaled(bus, journal, "health", {"trader", "clock"}));

    auto order = registry.start_order();
    CHECK(order == std::vector<std::string>{"clock", "market", "sensor", "trader", "health"});

    auto before = [&](const std::string& a, const std::string& b) {
        return std::find(order.begin(), order.end(), a) < std::find(order.begin(), order.end(), b);
    };
    for (const auto& agent : registry.get_all()) {
        for (const auto& dep : agent->config().dependencies) {
            CHECK(before(dep, agent->id()));
        }
    }

    registry.start_all();
    registry.stop_all();

    std::vector<std::string> stops;
    for (const auto& entry : journal.entries()) {
        if (entry.rfind("stop:", 0) == 0) stops.push_back(entry.substr(5));
    }
    CHECK(stops == std::vector<std::string>{"health", "trader", "sensor", "market", "clock"});
}

TEST_CASE("AgentRegistry registration errors") {
    EventBus bus;
    AgentRegistry registry(bus);
    registry.register_agent(std::make_shared<ScriptedAgent>(make_config("base"), bus));

    SUBCASE("duplicate id") {
        CHECK_THROWS_AS(registry.register_agent(std::make_shared<ScriptedAgent>(make_config("base"), bus)),
                        RegistryError);
        CHECK(registry.count() == 1);
    }

    SUBCASE("missing dependency") {
        CHECK_THROWS_WITH_AS(
            registry.register_agent(std::make_shared<ScriptedAgent>(make_config("derived", {"ghost"}), bus)),
            "Agent derived depends on ghost, which is not registered", RegistryError);
        CHECK_FALSE(registry.has("derived"));
    }

    SUBCASE("null agent") {
        CHECK_THROWS_AS(registry.register_agent(nullptr), RegistryError);
    }

    SUBCASE("unknown id for start/stop") {
        CHECK_THROWS_WITH_AS(registry.start_agent("ghost"), "Agent not found: ghost", RegistryError);
        CHECK_THROWS_AS(registry.stop_agent("ghost"), RegistryError);
    }
}

TEST_CASE("AgentRegistry unregister") {
    EventBus bus;
    AgentRegistry registry(bus);
    auto base = std::make_shared<ScriptedAgent>(make_config("base"), bus);
    registry.register_agent(base);
    registry.register_agent(std::make_shared<ScriptedAgent>(make_config("a", {"base"}), bus));
    registry.register_agent(std::make_shared<ScriptedAgent>(make_config("b", {"base"}), bus));
    registry.start_all();

    CHECK(registry.get_dependents("base") == std::vector<std::string>{"a", "b"});
    CHECK(registry.get_dependencies("a") == std::vector<std::string>{"base"});

    CHECK_THROWS_WITH_AS(registry.unregister_agent("base"),
                         "Cannot unregister base: agents a, b depend on it", RegistryError);
    CHECK(registry.has("base"));
    CHECK(base->status() == AgentStatus::RUNNING);

    CHECK_FALSE(registry.unregister_agent("ghost"));

    CHECK(registry.unregister_agent("a"));
    CHECK(registry.unregister_agent("b"));
    CHECK(registry.unregister_agent("base"));
    CHECK(base->status() == AgentStatus::STOPPED);
    CHECK(registry.count() == 0);
    CHECK(registry.get("base") == nullptr);

    REQUIRE(bus.flush());
    HistoryFilter filter;
    filter.type = "registry:agent_unregistered";
    CHECK(bus.get_history(filter).size() == 3);
}

TEST_CASE("AgentRegistry start_all skips disabled agents and survives failures") {
    EventBus bus;
    AgentRegistry registry(bus);

    auto config = make_config("dormant");
    config.enabled = false;
    auto dormant = std::make_shared<ScriptedAgent>(config, bus);
    auto broken = std::make_shared<ScriptedAgent>(make_config("broken"), bus);
    broken->start_hook = [](ScriptedAgent&) { throw std::runtime_error("cannot open port"); };
    auto healthy = std::make_shared<ScriptedAgent>(make_config("healthy"), bus);

    registry.register_agent(dormant);
    registry.register_agent(broken);
    registry.register_agent(healthy);
    registry.start_all();

    CHECK(dormant->status() == AgentStatus::IDLE);
    CHECK(broken->status() == AgentStatus::ERROR);
    CHECK(healthy->status() == AgentStatus::RUNNING);

    REQUIRE(bus.flush());
    HistoryFilter filter;
    filter.type = "registry:all_started";
    auto started = bus.get_history(filter);
    REQUIRE(started.size() == 1);
    CHECK(started[0].payload["count"] == 3);
    CHECK(started[0].payload["running"] == 1);

    CHECK(registry.error_count("broken") == 1);
    CHECK(registry.error_count("healthy") == 0);

    auto stats = registry.stats();
    CHECK(stats.total == 3);
    CHECK(stats.errors == 1);
    CHECK(stats.by_status["idle"] == 1);
    CHECK(stats.by_status["error"] == 1);
    CHECK(stats.by_status["running"] == 1);
    CHECK(stats.by_status["paused"] == 0);
}

TEST_CASE("AgentRegistry tier index and queries") {
    EventBus bus;
    AgentRegistry registry(bus);

    auto clock_config = make_config("clock", {}, 0, AgentTier::FOUNDATION);
    clock_config.name = "System Clock";
    auto camera_config = make_config("camera", {"clock"}, 0, AgentTier::SENSING);
    camera_config.name = "Front Camera";
    auto lidar_config = make_config("lidar", {"clock"}, 0, AgentTier::SENSING);
    lidar_config.name = "Lidar";

    registry.register_agent(std::make_shared<ScriptedAgent>(clock_config, bus));
    registry.register_agent(std::make_shared<ScriptedAgent>(camera_config, bus));
    registry.register_agent(std::make_shared<ScriptedAgent>(lidar_config, bus));
    registry.start_agent("clock");
    registry.start_agent("camera");

    auto sensing = registry.get_by_tier(AgentTier::SENSING);
    REQUIRE(sensing.size() == 2);
    CHECK(sensing[0]->id() == "camera");
    CHECK(sensing[1]->id() == "lidar");
    CHECK(registry.get_by_tier(AgentTier::LEARNING).empty());

    AgentQuery by_name;
    by_name.name = "CAMERA";
    auto found = registry.find(by_name);
    REQUIRE(found.size() == 1);
    CHECK(found[0]->id() == "camera");

    AgentQuery running_sensors;
    running_sensors.tier = AgentTier::SENSING;
    running_sensors.status = AgentStatus::RUNNING;
    found = registry.find(running_sensors);
    REQUIRE(found.size() == 1);
    CHECK(found[0]->id() == "camera");

    CHECK(registry.find(AgentQuery{}).size() == 3);

    auto config = registry.get_config("lidar");
    REQUIRE(config.has_value());
    CHECK(config->name == "Lidar");
    CHECK_FALSE(registry.get_config("ghost").has_value());

    auto stats = registry.stats();
    CHECK(stats.by_tier["sensing"] == 2);
    CHECK(stats.by_tier["foundation"] == 1);
    CHECK(stats.by_tier["learning"] == 0);
    CHECK(stats.to_json()["byTier"]["sensing"] == 2);

    registry.stop_agent("camera");
    CHECK(registry.get("camera")->status() == AgentStatus::STOPPED);
}

TEST_CASE("resolve_start_order reports dependency cycles") {
    everos::runtime::DependencyGraph graph{
        {"a", {"b"}},
        {"b", {"c"}},
        {"c", {"a"}},
        {"d", {}}
    };

    try {
        everos::runtime::resolve_start_order({"d", "a", "b", "c"}, graph);
        FAIL("expected DependencyCycleError");
    } catch (const DependencyCycleError& e) {
        CHECK(e.cycle() == std::vector<std::string>{"a", "b", "c", "a"});
        CHECK(std::string(e.what()) == "Dependency cycle detected: a -> b -> c -> a");
    }

    SUBCASE("self dependency") {
        everos::runtime::DependencyGraph self{{"x", {"x"}}};
        CHECK_THROWS_AS(everos::runtime::resolve_start_order({"x"}, self), DependencyCycleError);
    }

    SUBCASE("unknown dependencies are ignored") {
        everos::runtime::DependencyGraph partial{{"x", {"gone", "y"}}};
        CHECK(everos::runtime::resolve_start_order({"x", "y"}, partial) ==
              std::vector<std::string>{"y", "x"});
    }
}

TEST_CASE("AgentRegistry counts agent errors reported on the bus") {
    EventBus bus;
    AgentRegistry registry(bus);
    auto agent = std::make_shared<ScriptedAgent>(make_config("flaky"), bus);
    agent->tick_hook = [](ScriptedAgent&) { throw std::runtime_error("glitch"); };
    registry.register_agent(agent);

    registry.start_all();
    agent->tick();
    registry.start_agent("flaky");
    agent->tick();
    REQUIRE(bus.flush());

    CHECK(registry.error_count("flaky") == 2);
    CHECK(registry.stats().errors == 2);
}

TEST_CASE("AgentRegistry destruction waits for an agent:error delivery in flight") {
    EventBus bus;
    auto registry = std::make_unique<AgentRegistry>(bus);
    // Runs ahead of the registry's own agent:error handler and holds it back
    everos::test::DispatchGate gate(bus, "agent:error", 10);
    gate.close({{"agentId", "ghost"}});

    auto destroyed = std::async(std::launch::async, [&registry]() { registry.reset(); });
    CHECK(destroyed.wait_for(30ms) == std::future_status::timeout);

    gate.open();
    REQUIRE(destroyed.wait_for(2000ms) == std::future_status::ready);
    REQUIRE(bus.flush());
    CHECK(bus.get_stats().subscriptions == 1);
}
