#pragma once

#include "blackjack/types.hpp"

#include <array>
#include <shared_mutex>
#include <string>

namespace blackjack {

// Remaining cards per rank, indexed by rank_index().
using Composition = std::array<int, kRankCount>;

struct DealResult {
    int running_count = 0;
    double true_count = 0.0;
    double remaining_decks = 0.0;
};

struct ShoeStatus {
    int num_decks = 0;
    int running_count = 0;
    double true_count = 0.0;
    int remaining_cards = 0;
    double remaining_decks = 0.0;
    int cards_dealt = 0;
    double penetration = 0.0;
    Composition composition{};
};

Composition full_composition(int num_decks);

// running_count / (remaining_cards / 52), or 0 for an empty shoe.
double compute_true_count(int running_count, int remaining_cards);

BetAdvice betting_recommendation(double true_count);

class ShoeState {
public:
    explicit ShoeState(int num_decks = kDefaultDecks);

    ShoeState(const ShoeState&) = delete;
    ShoeState& operator=(const ShoeState&) = delete;

    DealResult deal_card(Rank rank);
    DealResult deal_card(const std::string& symbol);

    // Puts a previously dealt card back (operator correction).
    DealResult restore_card(Rank rank);

    ShoeStatus status() const;
    Composition composition() const;

    void reset();
    void reset(int num_decks);

    BetAdvice betting_recommendation() const;

    int num_decks() const;
    int running_count() const;
    double true_count() const;
    int remaining_cards() const;

private:
    void reset_locked(int num_decks);
    DealResult snapshot_locked() const;

    mutable std::shared_mutex mutex_;
    int num_decks_ = 0;
    Composition counts_{};
    int remaining_cards_ = 0;
    int running_count_ = 0;
    double true_count_ = 0.0;
};

} // namespace blackjack
