#include "blackjack/shoe.hpp"

#include "blackjack/errors.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace blackjack {

Composition full_composition(int num_decks) {
    Composition c{};
    c.fill(4 * num_decks);
    return c;
}

double compute_true_count(int running_count, int remaining_cards) {
    const double remaining_decks = static_cast<double>(remaining_cards) / kCardsPerDeck;
    if (remaining_decks <= 0.0) {
        return 0.0;
    }
    return running_count / remaining_decks;
}

BetAdvice betting_recommendation(double true_count) {
    if (true_count >= 3.0) {
        return BetAdvice::Increase;
    }
    if (true_count >= 1.0) {
        return BetAdvice::SlightAdvantage;
    }
    return BetAdvice::Minimum;
}

ShoeState::ShoeState(int num_decks) {
    reset_locked(num_decks);
}

void ShoeState::reset_locked(int num_decks) {
    if (num_decks < 1 || num_decks > kMaxDecks) {
        throw std::invalid_argument("num_decks must be in [1, " + std::to_string(kMaxDecks) + "], got " +
                                    std::to_string(num_decks));
    }
    num_decks_ = num_decks;
    counts_ = full_composition(num_decks);
    remaining_cards_ = num_decks * kCardsPerDeck;
    running_count_ = 0;
    true_count_ = 0.0;
}

DealResult ShoeState::snapshot_locked() const {
    DealResult r;
    r.running_count = running_count_;
    r.true_count = true_count_;
    r.remaining_decks = static_cast<double>(remaining_cards_) / kCardsPerDeck;
    return r;
}

DealResult ShoeState::deal_card(Rank rank) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    int& count = counts_[rank_index(rank)];
    if (count <= 0) {
        throw ShoeExhausted("No more " + to_string(rank) + " cards left in shoe");
    }

    --count;
    --remaining_cards_;
    running_count_ += hi_lo_tag(rank);
    true_count_ = compute_true_count(running_count_, remaining_cards_);
    return snapshot_locked();
}

DealResult ShoeState::deal_card(const std::string& symbol) {
    return deal_card(parse_rank(symbol));
}

DealResult ShoeState::restore_card(Rank rank) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    int& count = counts_[rank_index(rank)];
    if (count >= 4 * num_decks_) {
        throw CardNotDealt("No " + to_string(rank) + " has been dealt from this shoe");
    }

    ++count;
    ++remaining_cards_;
    running_count_ -= hi_lo_tag(rank);
    true_count_ = compute_true_count(running_count_, remaining_cards_);
    return snapshot_locked();
}

ShoeStatus ShoeState::status() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const int total = num_decks_ * kCardsPerDeck;

    ShoeStatus s;
    s.num_decks = num_decks_;
    s.running_count = running_count_;
    s.true_count = true_count_;
    s.remaining_cards = remaining_cards_;
    s.remaining_decks = static_cast<double>(remaining_cards_) / kCardsPerDeck;
    s.cards_dealt = total - remaining_cards_;
    s.penetration = static_cast<double>(s.cards_dealt) / total;
    s.composition = counts_;
    return s;
}

Composition ShoeState::composition() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return counts_;
}

void ShoeState::reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    reset_locked(num_decks_);
}

void ShoeState::reset(int num_decks) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    reset_locked(num_decks);
}

BetAdvice ShoeState::betting_recommendation() const {
    return blackjack::betting_recommendation(true_count());
}

int ShoeState::num_decks() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return num_decks_;
}

int ShoeState::running_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return running_count_;
}

double ShoeState::true_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return true_count_;
}

int ShoeState::remaining_cards() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return remaining_cards_;
}

} // namespace blackjack
