#pragma once
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace everos::runtime {

// Registration or lookup misuse: duplicate id, missing dependency,
// unregistering an agent others depend on, unknown id
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DependencyCycleError : public RegistryError {
public:
    explicit DependencyCycleError(std::vector<std::string> cycle);

    // e.g. {"a", "b", "a"}
    const std::vector<std::string>& cycle() const { return cycle_; }

private:
    std::vector<std::string> cycle_;
};

// agent id -> ids it depends on, in declaration order
using DependencyGraph = std::unordered_map<std::string, std::vector<std::string>>;

// Depth-first topological order: every dependency precedes its dependents and
// each id appears once. Roots are visited in the order of `ids`, so the result
// is stable for a given registration order. Dependencies not listed in `ids`
// are ignored. Throws DependencyCycleError.
std::vector<std::string> resolve_start_order(const std::vector<std::string>& ids,
                                             const DependencyGraph& graph);

} // namespace everos::runtime
