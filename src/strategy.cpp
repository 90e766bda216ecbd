#include "blackjack/strategy.hpp"

#include "hand_logic.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace blackjack {

namespace {

bool in(int v, std::initializer_list<int> values) {
    return std::find(values.begin(), values.end(), v) != values.end();
}

Action pair_play(int total, int dealer, int tc) {
    switch (total) {
        case 22:
            return Action::Split;
        case 20:
            return (in(dealer, {5, 6}) && tc >= 5) ? Action::Split : Action::Stand;
        case 18:
            return in(dealer, {2, 3, 4, 5, 6, 8, 9}) ? Action::Split : Action::Stand;
        case 16:
            return Action::Split;
        case 14:
            return dealer <= 7 ? Action::Split : Action::Hit;
        case 12:
            return dealer <= 6 ? Action::Split : Action::Hit;
        case 10:
            return dealer <= 9 ? Action::Double : Action::Hit;
        case 8:
            return Action::Hit;
        case 6:
        case 4:
            return in(dealer, {4, 5, 6, 7}) ? Action::Split : Action::Hit;
        default:
            return Action::Hit;
    }
}

Action soft_play(int total, int dealer) {
    if (total >= 19) {
        return Action::Stand;
    }
    if (total == 18) {
        if (in(dealer, {3, 4, 5, 6})) {
            return Action::Double;
        }
        return in(dealer, {2, 7, 8}) ? Action::Stand : Action::Hit;
    }
    if (total == 17) {
        return in(dealer, {3, 4, 5, 6}) ? Action::Double : Action::Hit;
    }
    if (total >= 15) {
        return in(dealer, {4, 5, 6}) ? Action::Double : Action::Hit;
    }
    return in(dealer, {5, 6}) ? Action::Double : Action::Hit;
}

Action hard_play(int total, int dealer, int tc) {
    // Index plays first.
    if (total == 16 && dealer == 10) {
        return tc >= 0 ? Action::Stand : Action::Hit;
    }
    if (total == 15 && dealer == 10) {
        return tc >= 4 ? Action::Stand : Action::Hit;
    }
    if (total == 12 && dealer == 2) {
        return tc >= 3 ? Action::Stand : Action::Hit;
    }
    if (total == 12 && dealer == 3) {
        return tc >= 2 ? Action::Stand : Action::Hit;
    }
    if (total == 13 && dealer == 2) {
        return tc <= -1 ? Action::Hit : Action::Stand;
    }
    if (total == 13 && dealer == 3) {
        return tc <= -2 ? Action::Hit : Action::Stand;
    }

    if (total >= 17) {
        return Action::Stand;
    }
    if (total >= 13 && dealer <= 6) {
        return Action::Stand;
    }
    if (total == 12 && in(dealer, {4, 5, 6})) {
        return Action::Stand;
    }
    if (total == 11) {
        return Action::Double;
    }
    if (total == 10) {
        return dealer <= 9 ? Action::Double : Action::Hit;
    }
    if (total == 9) {
        return in(dealer, {3, 4, 5, 6}) ? Action::Double : Action::Hit;
    }
    return Action::Hit;
}

} // namespace

void validate_hand(const HandDescriptor& hand) {
    const int t = hand.player_total;
    if (hand.is_pair) {
        if (t < 4 || t > 22 || t % 2 != 0) {
            throw std::invalid_argument("pair total must be even in [4, 22], got " + std::to_string(t));
        }
        return;
    }
    if (t < 2 || t > 21) {
        throw std::invalid_argument("player total must be in [2, 21], got " + std::to_string(t));
    }
    // Soft 12 is A,A and reads as a pair.
    if (hand.is_soft && t < 13) {
        throw std::invalid_argument("soft total must be in [13, 21], got " + std::to_string(t));
    }
}

std::vector<Action> allowed_actions(const HandDescriptor& hand) {
    std::vector<Action> out{Action::Hit, Action::Stand};
    if (hand.after_split) {
        return out;
    }

    const bool soft = hand.is_soft && !hand.is_pair;
    const int t = hand.player_total;
    if (!hand.is_pair && ((!soft && t >= 9 && t <= 11) || (soft && t >= 13 && t <= 18))) {
        out.push_back(Action::Double);
    }
    if (hand.is_pair) {
        out.push_back(Action::Split);
    }
    return out;
}

bool is_allowed(const HandDescriptor& hand, Action action) {
    const auto actions = allowed_actions(hand);
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

Action basic_strategy(const HandDescriptor& hand, double true_count) {
    const int dealer = rank_value(hand.dealer_upcard);
    const int tc = static_cast<int>(std::lround(true_count));

    Action a = Action::Hit;
    if (hand.is_pair) {
        a = pair_play(hand.player_total, dealer, tc);
    } else if (hand.is_soft) {
        a = soft_play(hand.player_total, dealer);
    } else {
        a = hard_play(hand.player_total, dealer, tc);
    }

    if (!is_allowed(hand, a)) {
        // After a split the chart's pair play no longer applies.
        if (a == Action::Split) {
            HandDescriptor played = hand;
            played.is_pair = false;
            played.is_soft = hand.player_total == 22;
            if (played.is_soft) {
                played.player_total = 12;
            }
            return basic_strategy(played, true_count);
        }
        return Action::Hit;
    }
    return a;
}

HandDescriptor describe_hand(const std::vector<Rank>& cards, Rank dealer_upcard) {
    if (cards.size() < 2) {
        throw std::invalid_argument("a hand needs at least two cards");
    }

    detail::HandTotal h;
    for (Rank r : cards) {
        detail::add_card(h, r);
    }
    if (h.is_bust()) {
        throw std::invalid_argument("hand is already bust at " + std::to_string(h.total));
    }

    HandDescriptor d;
    d.dealer_upcard = dealer_upcard;
    d.is_pair = cards.size() == 2 && rank_value(cards[0]) == rank_value(cards[1]);
    if (d.is_pair) {
        d.player_total = 2 * rank_value(cards[0]);
        d.is_soft = false;
    } else {
        d.player_total = h.total;
        d.is_soft = h.is_soft();
    }
    return d;
}

} // namespace blackjack
