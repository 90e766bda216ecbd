#pragma once

#include "blackjack/shoe.hpp"
#include "blackjack/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blackjack {

struct SimulationConfig {
    int trials_per_action = 30000;
    std::uint64_t seed = 12345;
    // Trials are split into contiguous ranges, one per worker.
    int worker_threads = 1;
};

struct ActionEstimate {
    Action action = Action::Stand;
    double ev = 0.0;
    int completed_trials = 0;
    int aborted_trials = 0;
};

struct Evaluation {
    // Enumeration order of allowed_actions().
    std::vector<ActionEstimate> estimates;
    Action best = Action::Stand;
    Action basic_strategy = Action::Stand;
    std::string info;

    std::optional<double> ev(Action a) const;
    int aborted_trials() const;
};

class EvSimulator {
public:
    explicit EvSimulator(TableRules rules = TableRules{}, SimulationConfig config = SimulationConfig{});

    // Snapshots the shoe composition once, then simulates every allowed action.
    Evaluation evaluate(const ShoeState& shoe, const HandDescriptor& hand) const;
    Evaluation evaluate(const ShoeState& shoe, const HandDescriptor& hand, int trials_per_action) const;

    // Composition-based entry point; true_count only feeds the basic-strategy baseline.
    Evaluation evaluate(const Composition& composition, const HandDescriptor& hand,
                        int trials_per_action, double true_count = 0.0) const;

    ActionEstimate simulate_action(const Composition& composition, const HandDescriptor& hand,
                                   Action action, int trials) const;

    const TableRules& rules() const { return rules_; }
    const SimulationConfig& config() const { return config_; }

private:
    TableRules rules_;
    SimulationConfig config_;
};

} // namespace blackjack
