#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace blackjack {

enum class Rank {
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

constexpr std::size_t kRankCount = 13;
constexpr int kCardsPerDeck = 52;
constexpr int kDefaultDecks = 8;
constexpr int kMaxDecks = 64;

constexpr std::array<Rank, kRankCount> kAllRanks{
    Rank::Two, Rank::Three, Rank::Four, Rank::Five, Rank::Six,
    Rank::Seven, Rank::Eight, Rank::Nine, Rank::Ten,
    Rank::Jack, Rank::Queen, Rank::King, Rank::Ace
};

enum class Action {
    Hit,
    Stand,
    Double,
    Split
};

enum class BetAdvice {
    Increase,
    SlightAdvantage,
    Minimum
};

struct HandDescriptor {
    int player_total = 0;
    Rank dealer_upcard = Rank::Two;
    bool is_soft = false;
    bool is_pair = false;
    // Hand was produced by a split: no double (no DAS), no resplit.
    bool after_split = false;
};

struct TableRules {
    int num_decks = kDefaultDecks;
    // false = S17 (dealer stands on every 17), true = H17.
    bool dealer_hits_soft_17 = false;
};

inline std::size_t rank_index(Rank r) {
    return static_cast<std::size_t>(r);
}

// Blackjack value with the ace counted high (11).
int rank_value(Rank r);

// Hi-Lo tag: +1 for 2..6, 0 for 7..9, -1 for ten-values and aces.
int hi_lo_tag(Rank r);

// Canonical symbols only: "2".."10", "J", "Q", "K", "A" (case-insensitive).
Rank parse_rank(const std::string& symbol);

// Operator input: canonical symbols plus 1=A, 11=J, 12=Q, 13=K.
Rank parse_card_input(const std::string& input);

std::string to_string(Rank r);
std::string to_string(Action a);
std::string to_string(BetAdvice advice);
std::string describe(BetAdvice advice);
std::string describe(const TableRules& rules);

} // namespace blackjack
