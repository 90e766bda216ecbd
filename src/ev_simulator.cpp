#include "blackjack/simulator.hpp"

#include "blackjack/errors.hpp"
#include "blackjack/strategy.hpp"

#include "hand_logic.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace blackjack {

namespace {

using detail::HandTotal;
using detail::Rng;
using detail::WorkingDeck;

std::uint64_t splitmix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

// Independent stream per (seed, action, trial); no RNG state is shared between trials.
Rng trial_rng(std::uint64_t seed, Action action, int trial) {
    std::uint64_t s = splitmix64(seed);
    s = splitmix64(s ^ (static_cast<std::uint64_t>(action) + 1));
    s = splitmix64(s ^ static_cast<std::uint64_t>(trial));
    return Rng(s);
}

int resolve_stand(const HandDescriptor& hand, const HandTotal& start, WorkingDeck& deck, Rng& rng,
                  const TableRules& rules) {
    const int dealer = detail::play_dealer(hand.dealer_upcard, deck, rng, rules);
    return detail::settle(start.total, dealer, 1);
}

int resolve_hit(const HandDescriptor& hand, const HandTotal& start, WorkingDeck& deck, Rng& rng,
                const TableRules& rules) {
    HandTotal h = start;
    detail::add_card(h, deck.draw(rng));
    while (detail::hit_again(h)) {
        detail::add_card(h, deck.draw(rng));
    }
    if (h.is_bust()) {
        return -1;
    }
    const int dealer = detail::play_dealer(hand.dealer_upcard, deck, rng, rules);
    return detail::settle(h.total, dealer, 1);
}

int resolve_double(const HandDescriptor& hand, const HandTotal& start, WorkingDeck& deck, Rng& rng,
                   const TableRules& rules) {
    HandTotal h = start;
    detail::add_card(h, deck.draw(rng));
    if (h.is_bust()) {
        return -2;
    }
    const int dealer = detail::play_dealer(hand.dealer_upcard, deck, rng, rules);
    return detail::settle(h.total, dealer, 2);
}

int resolve_split(const HandDescriptor& hand, WorkingDeck& deck, Rng& rng, const TableRules& rules) {
    const Rank pair = detail::pair_rank(hand.player_total);

    std::array<HandTotal, 2> hands{};
    for (HandTotal& h : hands) {
        detail::add_card(h, pair);
        detail::add_card(h, deck.draw(rng));
        // Split aces take exactly one card.
        if (pair != Rank::Ace && detail::split_hand_draws(h, hand.dealer_upcard)) {
            detail::add_card(h, deck.draw(rng));
        }
    }

    if (hands[0].is_bust() && hands[1].is_bust()) {
        return -2;
    }

    // One dealer hand settles both split hands.
    const int dealer = detail::play_dealer(hand.dealer_upcard, deck, rng, rules);
    return detail::settle(hands[0].total, dealer, 1) + detail::settle(hands[1].total, dealer, 1);
}

int run_trial(const Composition& composition, const HandDescriptor& hand, const HandTotal& start,
              Action action, Rng& rng, const TableRules& rules) {
    WorkingDeck deck(composition);
    deck.remove(hand.dealer_upcard);

    switch (action) {
        case Action::Stand:
            return resolve_stand(hand, start, deck, rng, rules);
        case Action::Hit:
            return resolve_hit(hand, start, deck, rng, rules);
        case Action::Double:
            return resolve_double(hand, start, deck, rng, rules);
        case Action::Split:
            return resolve_split(hand, deck, rng, rules);
    }
    throw std::logic_error("unhandled action");
}

struct JoinGuard {
    std::vector<std::thread>& threads;

    ~JoinGuard() {
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    }
};

struct RangeResult {
    long long profit = 0;
    int completed = 0;
    int aborted = 0;
    std::exception_ptr error;
};

} // namespace

std::optional<double> Evaluation::ev(Action a) const {
    for (const auto& e : estimates) {
        if (e.action == a) {
            return e.ev;
        }
    }
    return std::nullopt;
}

int Evaluation::aborted_trials() const {
    int n = 0;
    for (const auto& e : estimates) {
        n += e.aborted_trials;
    }
    return n;
}

EvSimulator::EvSimulator(TableRules rules, SimulationConfig config)
    : rules_(std::move(rules)), config_(std::move(config)) {}

ActionEstimate EvSimulator::simulate_action(const Composition& composition, const HandDescriptor& hand,
                                            Action action, int trials) const {
    if (trials <= 0) {
        throw std::invalid_argument("trials must be positive");
    }
    validate_hand(hand);
    if (!is_allowed(hand, action)) {
        throw std::invalid_argument(to_string(action) + " is not allowed for this hand");
    }

    const HandTotal start = detail::starting_hand(hand);
    const int workers = std::max(1, std::min(config_.worker_threads, trials));
    std::vector<RangeResult> results(static_cast<std::size_t>(workers));

    const auto run_range = [&](int w) {
        RangeResult& r = results[static_cast<std::size_t>(w)];
        const int begin = static_cast<int>(static_cast<long long>(trials) * w / workers);
        const int end = static_cast<int>(static_cast<long long>(trials) * (w + 1) / workers);
        try {
            for (int t = begin; t < end; ++t) {
                Rng rng = trial_rng(config_.seed, action, t);
                try {
                    r.profit += run_trial(composition, hand, start, action, rng, rules_);
                    ++r.completed;
                } catch (const DeckExhausted&) {
                    ++r.aborted;
                }
            }
        } catch (...) {
            r.error = std::current_exception();
        }
    };

    if (workers == 1) {
        run_range(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<std::size_t>(workers));
        // Started workers are joined even if a later one fails to launch.
        const JoinGuard guard{threads};
        for (int w = 0; w < workers; ++w) {
            threads.emplace_back(run_range, w);
        }
    }

    long long profit = 0;
    ActionEstimate est;
    est.action = action;
    for (const auto& r : results) {
        if (r.error) {
            std::rethrow_exception(r.error);
        }
        profit += r.profit;
        est.completed_trials += r.completed;
        est.aborted_trials += r.aborted;
    }

    if (est.completed_trials == 0) {
        throw DeckExhausted("every " + to_string(action) + " trial ran out of cards");
    }
    est.ev = static_cast<double>(profit) / est.completed_trials;
    return est;
}

Evaluation EvSimulator::evaluate(const Composition& composition, const HandDescriptor& hand,
                                 int trials_per_action, double true_count) const {
    validate_hand(hand);
    if (composition[rank_index(hand.dealer_upcard)] <= 0) {
        throw ShoeExhausted("Dealer upcard " + to_string(hand.dealer_upcard) + " is not in the shoe");
    }

    Evaluation out;
    out.info = describe(rules_);
    for (Action a : allowed_actions(hand)) {
        out.estimates.push_back(simulate_action(composition, hand, a, trials_per_action));
    }

    // Ties keep the earliest enumerated action.
    const auto best = std::max_element(out.estimates.begin(), out.estimates.end(),
                                       [](const ActionEstimate& a, const ActionEstimate& b) { return a.ev < b.ev; });
    out.best = best->action;
    out.basic_strategy = basic_strategy(hand, true_count);
    return out;
}

Evaluation EvSimulator::evaluate(const ShoeState& shoe, const HandDescriptor& hand, int trials_per_action) const {
    const ShoeStatus snapshot = shoe.status();
    Evaluation out = evaluate(snapshot.composition, hand, trials_per_action, snapshot.true_count);

    TableRules banner = rules_;
    banner.num_decks = snapshot.num_decks;
    out.info = describe(banner);
    return out;
}

Evaluation EvSimulator::evaluate(const ShoeState& shoe, const HandDescriptor& hand) const {
    return evaluate(shoe, hand, config_.trials_per_action);
}

} // namespace blackjack
