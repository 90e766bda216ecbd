#pragma once

#include "blackjack/shoe.hpp"
#include "blackjack/simulator.hpp"
#include "blackjack/types.hpp"

#include <string>

namespace blackjack {

// Operator-facing facade: one live shoe plus the simulator that reads it.
// Card arguments accept the operator aliases of parse_card_input().
class Advisor {
public:
    explicit Advisor(TableRules rules = TableRules{}, SimulationConfig config = SimulationConfig{});

    DealResult deal_card(const std::string& card);
    DealResult restore_card(const std::string& card);

    ShoeStatus get_status() const;

    void reset_shoe();
    void reset_shoe(int num_decks);

    BetAdvice betting_recommendation() const;

    Evaluation evaluate(int player_total, const std::string& dealer_upcard, bool is_soft, bool is_pair) const;
    Evaluation evaluate(int player_total, const std::string& dealer_upcard, bool is_soft, bool is_pair,
                        int trials) const;

    Action move_recommendation(int player_total, const std::string& dealer_upcard, bool is_soft,
                               bool is_pair) const;

    const ShoeState& shoe() const { return shoe_; }
    const EvSimulator& simulator() const { return simulator_; }

private:
    static HandDescriptor make_hand(int player_total, const std::string& dealer_upcard, bool is_soft, bool is_pair);

    ShoeState shoe_;
    EvSimulator simulator_;
};

} // namespace blackjack
