#include "runtime/agent/dependency_graph.hpp"
#include <algorithm>
#include <unordered_set>

namespace everos::runtime {

namespace {

std::string describe_cycle(const std::vector<std::string>& cycle) {
    std::string text;
    for (const auto& id : cycle) {
        if (!text.empty()) text += " -> ";
        text += id;
    }
    return text;
}

enum class Mark { VISITING, VISITED };

class OrderResolver {
public:
    OrderResolver(const std::vector<std::string>& ids, const DependencyGraph& graph)
        : graph_(graph), known_(ids.begin(), ids.end()) {}

    void visit(const std::string& id) {
        auto mark = marks_.find(id);
        if (mark != marks_.end()) {
            if (mark->second == Mark::VISITING) {
                throw DependencyCycleError(cycle_through(id));
            }
            return;
        }

        marks_[id] = Mark::VISITING;
        path_.push_back(id);

        auto deps = graph_.find(id);
        if (deps != graph_.end()) {
            for (const auto& dep : deps->second) {
                if (known_.count(dep)) {
                    visit(dep);
                }
            }
        }

        path_.pop_back();
        marks_[id] = Mark::VISITED;
        order_.push_back(id);
    }

    std::vector<std::string> take() { return std::move(order_); }

private:
    std::vector<std::string> cycle_through(const std::string& id) const {
        auto start = std::find(path_.begin(), path_.end(), id);
        std::vector<std::string> cycle(start, path_.end());
        cycle.push_back(id);
        return cycle;
    }

    const DependencyGraph& graph_;
    std::unordered_set<std::string> known_;
    std::unordered_map<std::string, Mark> marks_;
    std::vector<std::string> path_;
    std::vector<std::string> order_;
};

} // namespace

DependencyCycleError::DependencyCycleError(std::vector<std::string> cycle)
    : RegistryError("Dependency cycle detected: " + describe_cycle(cycle)),
      cycle_(std::move(cycle)) {}

std::vector<std::string> resolve_start_order(const std::vector<std::string>& ids,
                                             const DependencyGraph& graph) {
    OrderResolver resolver(ids, graph);
    for (const auto& id : ids) {
        resolver.visit(id);
    }
    return resolver.take();
}

} // namespace everos::runtime
