#include "blackjack/advisor.hpp"

#include "blackjack/strategy.hpp"

namespace blackjack {

Advisor::Advisor(TableRules rules, SimulationConfig config)
    : shoe_(rules.num_decks), simulator_(rules, config) {}

HandDescriptor Advisor::make_hand(int player_total, const std::string& dealer_upcard, bool is_soft, bool is_pair) {
    HandDescriptor hand;
    hand.player_total = player_total;
    hand.dealer_upcard = parse_card_input(dealer_upcard);
    // Pair overrides soft.
    hand.is_soft = is_pair ? false : is_soft;
    hand.is_pair = is_pair;
    return hand;
}

DealResult Advisor::deal_card(const std::string& card) {
    return shoe_.deal_card(parse_card_input(card));
}

DealResult Advisor::restore_card(const std::string& card) {
    return shoe_.restore_card(parse_card_input(card));
}

ShoeStatus Advisor::get_status() const {
    return shoe_.status();
}

void Advisor::reset_shoe() {
    shoe_.reset();
}

void Advisor::reset_shoe(int num_decks) {
    shoe_.reset(num_decks);
}

BetAdvice Advisor::betting_recommendation() const {
    return shoe_.betting_recommendation();
}

Evaluation Advisor::evaluate(int player_total, const std::string& dealer_upcard, bool is_soft, bool is_pair) const {
    return evaluate(player_total, dealer_upcard, is_soft, is_pair, simulator_.config().trials_per_action);
}

Evaluation Advisor::evaluate(int player_total, const std::string& dealer_upcard, bool is_soft, bool is_pair,
                             int trials) const {
    return simulator_.evaluate(shoe_, make_hand(player_total, dealer_upcard, is_soft, is_pair), trials);
}

Action Advisor::move_recommendation(int player_total, const std::string& dealer_upcard, bool is_soft,
                                    bool is_pair) const {
    const HandDescriptor hand = make_hand(player_total, dealer_upcard, is_soft, is_pair);
    validate_hand(hand);
    return basic_strategy(hand, shoe_.true_count());
}

} // namespace blackjack
