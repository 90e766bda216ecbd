#include "blackjack/advisor.hpp"
#include "blackjack/errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace blackjack {
namespace {

SimulationConfig quick() {
    SimulationConfig config;
    config.trials_per_action = 500;
    config.seed = 7;
    return config;
}

TEST(Advisor, AcceptsOperatorAliases) {
    Advisor advisor;
    DealResult r = advisor.deal_card("1");
    EXPECT_EQ(r.running_count, -1);
    EXPECT_EQ(advisor.get_status().composition[rank_index(Rank::Ace)], 31);

    advisor.deal_card("13");
    advisor.deal_card("k");
    advisor.deal_card(" 11 ");
    const ShoeStatus s = advisor.get_status();
    EXPECT_EQ(s.running_count, -4);
    EXPECT_EQ(s.composition[rank_index(Rank::King)], 30);
    EXPECT_EQ(s.composition[rank_index(Rank::Jack)], 31);
}

TEST(Advisor, InvalidCardLeavesShoeUntouched) {
    Advisor advisor;
    advisor.deal_card("5");
    EXPECT_THROW(advisor.deal_card("X"), InvalidRank);
    EXPECT_THROW(advisor.deal_card("14"), InvalidRank);
    EXPECT_EQ(advisor.get_status().remaining_cards, 415);
    EXPECT_EQ(advisor.get_status().running_count, 1);
}

TEST(Advisor, RestoreTakesAliasesToo) {
    Advisor advisor;
    advisor.deal_card("Q");
    const DealResult r = advisor.restore_card("12");
    EXPECT_EQ(r.running_count, 0);
    EXPECT_EQ(advisor.get_status().remaining_cards, 416);
    EXPECT_THROW(advisor.restore_card("Q"), CardNotDealt);
}

TEST(Advisor, ResetShoeWithNewDeckCount) {
    Advisor advisor;
    advisor.deal_card("2");
    advisor.reset_shoe(6);
    EXPECT_EQ(advisor.get_status().num_decks, 6);
    EXPECT_EQ(advisor.get_status().remaining_cards, 312);

    advisor.deal_card("3");
    advisor.reset_shoe();
    EXPECT_EQ(advisor.get_status().num_decks, 6);
    EXPECT_EQ(advisor.get_status().running_count, 0);
}

TEST(Advisor, OversizedDeckCountIsRejected) {
    Advisor advisor;
    advisor.deal_card("K");
    EXPECT_THROW(advisor.reset_shoe(1000000000), std::invalid_argument);

    const ShoeStatus s = advisor.get_status();
    EXPECT_EQ(s.num_decks, 8);
    EXPECT_EQ(s.remaining_cards, 415);
    for (int c : s.composition) {
        EXPECT_GE(c, 0);
    }
}

TEST(Advisor, PairOverridesSoft) {
    Advisor advisor(TableRules{}, quick());
    const Evaluation e = advisor.evaluate(16, "10", true, true, 200);

    std::vector<Action> actions;
    for (const auto& est : e.estimates) {
        actions.push_back(est.action);
    }
    EXPECT_EQ(actions, (std::vector<Action>{Action::Hit, Action::Stand, Action::Split}));
}

TEST(Advisor, EvaluateReadsLiveShoe) {
    TableRules rules;
    rules.num_decks = 2;
    Advisor advisor(rules, quick());
    for (int i = 0; i < 8; ++i) {
        advisor.deal_card("A");
    }
    // No aces left for the upcard.
    EXPECT_THROW(advisor.evaluate(16, "A", false, false), ShoeExhausted);

    const Evaluation e = advisor.evaluate(12, "3", false, false);
    EXPECT_EQ(e.estimates.size(), 2u);
    EXPECT_EQ(e.info, "Monte Carlo EVs (2D, S17, no DAS, no surrender)");
    for (const auto& est : e.estimates) {
        EXPECT_EQ(est.completed_trials + est.aborted_trials, 500);
    }
}

TEST(Advisor, MoveRecommendationUsesTrueCount) {
    TableRules rules;
    rules.num_decks = 1;
    Advisor advisor(rules, quick());
    EXPECT_EQ(advisor.move_recommendation(15, "10", false, false), Action::Hit);

    for (int round = 0; round < 3; ++round) {
        for (const char* card : {"2", "3", "4", "5", "6"}) {
            advisor.deal_card(card);
        }
    }
    EXPECT_GE(advisor.shoe().true_count(), 4.0);
    EXPECT_EQ(advisor.move_recommendation(15, "10", false, false), Action::Stand);
    EXPECT_EQ(advisor.betting_recommendation(), BetAdvice::Increase);
}

TEST(Advisor, MoveRecommendationValidatesHand) {
    Advisor advisor;
    EXPECT_THROW(advisor.move_recommendation(23, "5", false, false), std::invalid_argument);
    EXPECT_THROW(advisor.move_recommendation(15, "5", false, true), std::invalid_argument);
    EXPECT_THROW(advisor.move_recommendation(15, "Z", false, false), InvalidRank);
}

} // namespace
} // namespace blackjack
