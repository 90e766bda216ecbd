#pragma once

#include "blackjack/types.hpp"

#include <vector>

namespace blackjack {

// Throws std::invalid_argument for totals outside 2..21 (even 4..22 for pairs).
void validate_hand(const HandDescriptor& hand);

// Legal actions in enumeration order: Hit, Stand, [Double], [Split].
std::vector<Action> allowed_actions(const HandDescriptor& hand);

bool is_allowed(const HandDescriptor& hand, Action action);

// 8-deck S17 no-DAS basic strategy with Hi-Lo index deviations.
// true_count is rounded to the nearest integer before index lookups.
Action basic_strategy(const HandDescriptor& hand, double true_count);

// Builds a descriptor from the player's cards. A pair of aces reports
// total 22 and a ten-value pair reports 20.
HandDescriptor describe_hand(const std::vector<Rank>& cards, Rank dealer_upcard);

} // namespace blackjack
