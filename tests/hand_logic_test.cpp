#include "hand_logic.hpp"

#include "blackjack/errors.hpp"

#include <gtest/gtest.h>

#include <set>

namespace blackjack::detail {
namespace {

Composition only(Rank r, int count) {
    Composition c{};
    c[rank_index(r)] = count;
    return c;
}

TEST(HandTotal, SoftAceDowngradesOnOverflow) {
    HandTotal h;
    add_card(h, Rank::Ace);
    add_card(h, Rank::Six);
    EXPECT_EQ(h.total, 17);
    EXPECT_TRUE(h.is_soft());

    add_card(h, Rank::King);
    EXPECT_EQ(h.total, 17);
    EXPECT_FALSE(h.is_soft());
    EXPECT_FALSE(h.is_bust());

    add_card(h, Rank::Five);
    EXPECT_TRUE(h.is_bust());
}

TEST(HandTotal, TwoAcesMakeSoftTwelve) {
    HandTotal h;
    add_card(h, Rank::Ace);
    add_card(h, Rank::Ace);
    EXPECT_EQ(h.total, 12);
    EXPECT_EQ(h.soft_aces, 1);
}

TEST(HandTotal, StartingHandFromDescriptor) {
    HandDescriptor aces{22, Rank::Six, false, true};
    HandTotal h = starting_hand(aces);
    EXPECT_EQ(h.total, 12);
    EXPECT_TRUE(h.is_soft());

    HandDescriptor eights{16, Rank::Ten, true, true};
    h = starting_hand(eights);
    EXPECT_EQ(h.total, 16);
    EXPECT_FALSE(h.is_soft());

    HandDescriptor soft18{18, Rank::Nine, true, false};
    h = starting_hand(soft18);
    EXPECT_EQ(h.total, 18);
    EXPECT_EQ(h.soft_aces, 1);
}

TEST(PairRank, DerivedFromTotal) {
    EXPECT_EQ(pair_rank(22), Rank::Ace);
    EXPECT_EQ(pair_rank(20), Rank::Ten);
    EXPECT_EQ(pair_rank(16), Rank::Eight);
    EXPECT_EQ(pair_rank(4), Rank::Two);
    EXPECT_THROW(pair_rank(15), std::invalid_argument);
    EXPECT_THROW(pair_rank(2), std::invalid_argument);
}

TEST(WorkingDeck, DrawsOnlyRemainingRanks) {
    Rng rng(1);
    WorkingDeck deck(only(Rank::Seven, 3));
    EXPECT_EQ(deck.remaining(), 3);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(deck.draw(rng), Rank::Seven);
    }
    EXPECT_EQ(deck.remaining(), 0);
    EXPECT_THROW(deck.draw(rng), DeckExhausted);
}

TEST(WorkingDeck, SamplesWithoutReplacement) {
    Composition c{};
    c[rank_index(Rank::Two)] = 1;
    c[rank_index(Rank::Ace)] = 1;
    c[rank_index(Rank::Nine)] = 1;

    Rng rng(99);
    WorkingDeck deck(c);
    std::set<Rank> seen;
    for (int i = 0; i < 3; ++i) {
        seen.insert(deck.draw(rng));
    }
    EXPECT_EQ(seen, (std::set<Rank>{Rank::Two, Rank::Nine, Rank::Ace}));
}

TEST(WorkingDeck, CopyLeavesSourceUntouched) {
    const Composition source = full_composition(1);
    WorkingDeck deck(source);
    Rng rng(3);
    deck.draw(rng);
    deck.remove(Rank::Ace);
    EXPECT_EQ(deck.remaining(), 50);
    EXPECT_LE(deck.count(Rank::Ace), 3);
    EXPECT_EQ(source, full_composition(1));
}

TEST(WorkingDeck, RemoveOfMissingRankFails) {
    WorkingDeck deck(only(Rank::Ten, 2));
    EXPECT_THROW(deck.remove(Rank::Ace), DeckExhausted);
    EXPECT_EQ(deck.remaining(), 2);
}

TEST(DealerPlay, BustsStiffAgainstTens) {
    Rng rng(5);
    WorkingDeck deck(only(Rank::Ten, 10));
    EXPECT_EQ(play_dealer(Rank::Six, deck, rng, TableRules{}), 26);
    EXPECT_EQ(deck.remaining(), 8);
}

TEST(DealerPlay, StandsOnSoftSeventeenUnderS17) {
    Rng rng(5);
    WorkingDeck deck(only(Rank::Six, 10));
    EXPECT_EQ(play_dealer(Rank::Ace, deck, rng, TableRules{}), 17);
    EXPECT_EQ(deck.remaining(), 9);
}

TEST(DealerPlay, HitsSoftSeventeenUnderH17) {
    TableRules h17;
    h17.dealer_hits_soft_17 = true;
    Rng rng(5);
    WorkingDeck deck(only(Rank::Six, 10));
    // A6 -> soft 17, +6 -> hard 13, +6 -> 19.
    EXPECT_EQ(play_dealer(Rank::Ace, deck, rng, h17), 19);
    EXPECT_EQ(deck.remaining(), 7);
}

TEST(Settle, StandardOutcomes) {
    EXPECT_EQ(settle(22, 17, 1), -1);
    EXPECT_EQ(settle(22, 25, 1), -1);
    EXPECT_EQ(settle(12, 24, 2), 2);
    EXPECT_EQ(settle(20, 19, 1), 1);
    EXPECT_EQ(settle(19, 20, 2), -2);
    EXPECT_EQ(settle(18, 18, 1), 0);
}

TEST(ContinuationPolicy, HitAgain) {
    EXPECT_TRUE(hit_again(HandTotal{11, 0}));
    EXPECT_FALSE(hit_again(HandTotal{12, 0}));
    EXPECT_FALSE(hit_again(HandTotal{16, 0}));
    EXPECT_TRUE(hit_again(HandTotal{17, 1}));
    EXPECT_TRUE(hit_again(HandTotal{18, 1}));
    EXPECT_FALSE(hit_again(HandTotal{19, 1}));
    EXPECT_FALSE(hit_again(HandTotal{23, 0}));
}

TEST(ContinuationPolicy, SplitHandDraws) {
    EXPECT_TRUE(split_hand_draws(HandTotal{11, 0}, Rank::Six));
    EXPECT_FALSE(split_hand_draws(HandTotal{12, 0}, Rank::Four));
    EXPECT_TRUE(split_hand_draws(HandTotal{12, 0}, Rank::Two));
    EXPECT_FALSE(split_hand_draws(HandTotal{13, 0}, Rank::Six));
    EXPECT_TRUE(split_hand_draws(HandTotal{13, 0}, Rank::Seven));
    EXPECT_TRUE(split_hand_draws(HandTotal{16, 0}, Rank::Ace));
    EXPECT_FALSE(split_hand_draws(HandTotal{17, 0}, Rank::Ten));
}

} // namespace
} // namespace blackjack::detail
