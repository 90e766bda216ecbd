#include "hand_logic.hpp"

#include "blackjack/errors.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include <stdexcept>
#include <string>

namespace blackjack::detail {

void normalize(HandTotal& h) {
    while (h.total > 21 && h.soft_aces > 0) {
        h.total -= 10;
        --h.soft_aces;
    }
}

void add_card(HandTotal& h, Rank r) {
    h.total += rank_value(r);
    if (r == Rank::Ace) {
        ++h.soft_aces;
    }
    normalize(h);
}

HandTotal starting_hand(const HandDescriptor& hand) {
    HandTotal h;
    if (hand.is_pair) {
        if (pair_rank(hand.player_total) == Rank::Ace) {
            h.total = 12;
            h.soft_aces = 1;
        } else {
            h.total = hand.player_total;
        }
        return h;
    }
    h.total = hand.player_total;
    h.soft_aces = hand.is_soft ? 1 : 0;
    return h;
}

Rank pair_rank(int player_total) {
    if (player_total == 22) {
        return Rank::Ace;
    }
    if (player_total == 20) {
        return Rank::Ten;
    }
    const int v = player_total / 2;
    if (v < 2 || v > 9 || player_total % 2 != 0) {
        throw std::invalid_argument("not a pair total: " + std::to_string(player_total));
    }
    return kAllRanks[static_cast<std::size_t>(v - 2)];
}

WorkingDeck::WorkingDeck(const Composition& counts)
    : counts_(counts), total_(std::accumulate(counts.begin(), counts.end(), 0)) {}

Rank WorkingDeck::draw(Rng& rng) {
    if (total_ <= 0) {
        throw DeckExhausted("Deck exhausted during simulation");
    }

    std::array<int, kRankCount> cumulative{};
    std::partial_sum(counts_.begin(), counts_.end(), cumulative.begin());

    std::uniform_int_distribution<int> dist(0, total_ - 1);
    const int pick = dist(rng);
    // First rank whose cumulative weight exceeds pick; empty ranks never match.
    const auto it = std::upper_bound(cumulative.begin(), cumulative.end(), pick);
    const auto idx = static_cast<std::size_t>(it - cumulative.begin());

    --counts_[idx];
    --total_;
    return kAllRanks[idx];
}

void WorkingDeck::remove(Rank r) {
    int& c = counts_[rank_index(r)];
    if (c <= 0) {
        throw DeckExhausted("No " + to_string(r) + " left to remove from working deck");
    }
    --c;
    --total_;
}

int play_dealer(Rank upcard, WorkingDeck& deck, Rng& rng, const TableRules& rules) {
    HandTotal h;
    add_card(h, upcard);
    add_card(h, deck.draw(rng));

    while (h.total < 17 || (rules.dealer_hits_soft_17 && h.total == 17 && h.is_soft())) {
        add_card(h, deck.draw(rng));
    }
    return h.total;
}

int settle(int player_total, int dealer_total, int wager) {
    if (player_total > 21) {
        return -wager;
    }
    if (dealer_total > 21) {
        return wager;
    }
    if (player_total > dealer_total) {
        return wager;
    }
    if (player_total < dealer_total) {
        return -wager;
    }
    return 0;
}

bool hit_again(const HandTotal& h) {
    if (h.is_bust()) {
        return false;
    }
    if (h.is_soft()) {
        return h.total <= 18;
    }
    return h.total <= 11;
}

bool split_hand_draws(const HandTotal& h, Rank upcard) {
    if (h.total <= 11) {
        return true;
    }
    if (h.total >= 17) {
        return false;
    }
    const int dealer = rank_value(upcard);
    const bool stand = (h.total == 12 && dealer >= 4 && dealer <= 6) || (h.total >= 13 && dealer <= 6);
    return !stand;
}

} // namespace blackjack::detail
