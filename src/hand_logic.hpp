#pragma once

#include "blackjack/shoe.hpp"
#include "blackjack/types.hpp"

#include <random>

namespace blackjack::detail {

using Rng = std::mt19937_64;

struct HandTotal {
    int total = 0;
    int soft_aces = 0; // aces still counted as 11

    bool is_soft() const { return soft_aces > 0; }
    bool is_bust() const { return total > 21; }
};

// Downgrades soft aces (11 -> 1) while the hand would otherwise bust.
void normalize(HandTotal& h);
void add_card(HandTotal& h, Rank r);

// Starting point for Hit/Stand/Double. A pair of aces plays as soft 12.
HandTotal starting_hand(const HandDescriptor& hand);

// 22 -> A,A; 20 -> ten pair; otherwise total / 2.
Rank pair_rank(int player_total);

// Per-trial copy of the shoe composition; draws without replacement.
class WorkingDeck {
public:
    explicit WorkingDeck(const Composition& counts);

    Rank draw(Rng& rng);
    void remove(Rank r);

    int remaining() const { return total_; }
    int count(Rank r) const { return counts_[rank_index(r)]; }

private:
    Composition counts_;
    int total_ = 0;
};

// Draws the hole card and completes the dealer hand; returns the final total.
int play_dealer(Rank upcard, WorkingDeck& deck, Rng& rng, const TableRules& rules);

// Signed profit in units of the original bet.
int settle(int player_total, int dealer_total, int wager);

// Continuation after the forced card of a Hit: hard <= 11, soft <= 18.
bool hit_again(const HandTotal& h);

// One optional draw on a non-ace split hand.
bool split_hand_draws(const HandTotal& h, Rank upcard);

} // namespace blackjack::detail
