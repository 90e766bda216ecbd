#include "blackjack/types.hpp"

#include "blackjack/errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace blackjack {

namespace {

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

} // namespace

int rank_value(Rank r) {
    switch (r) {
        case Rank::Two:
            return 2;
        case Rank::Three:
            return 3;
        case Rank::Four:
            return 4;
        case Rank::Five:
            return 5;
        case Rank::Six:
            return 6;
        case Rank::Seven:
            return 7;
        case Rank::Eight:
            return 8;
        case Rank::Nine:
            return 9;
        case Rank::Ten:
        case Rank::Jack:
        case Rank::Queen:
        case Rank::King:
            return 10;
        case Rank::Ace:
            return 11;
    }
    return 0;
}

int hi_lo_tag(Rank r) {
    const int v = rank_value(r);
    if (v <= 6) {
        return 1;
    }
    if (v <= 9) {
        return 0;
    }
    return -1;
}

Rank parse_rank(const std::string& symbol) {
    const std::string s = upper(symbol);
    for (Rank r : kAllRanks) {
        if (to_string(r) == s) {
            return r;
        }
    }
    throw InvalidRank(symbol);
}

Rank parse_card_input(const std::string& input) {
    std::string s = upper(input);
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }), s.end());
    if (s == "1") {
        return Rank::Ace;
    }
    if (s == "11") {
        return Rank::Jack;
    }
    if (s == "12") {
        return Rank::Queen;
    }
    if (s == "13") {
        return Rank::King;
    }
    return parse_rank(s);
}

std::string to_string(Rank r) {
    switch (r) {
        case Rank::Two:
            return "2";
        case Rank::Three:
            return "3";
        case Rank::Four:
            return "4";
        case Rank::Five:
            return "5";
        case Rank::Six:
            return "6";
        case Rank::Seven:
            return "7";
        case Rank::Eight:
            return "8";
        case Rank::Nine:
            return "9";
        case Rank::Ten:
            return "10";
        case Rank::Jack:
            return "J";
        case Rank::Queen:
            return "Q";
        case Rank::King:
            return "K";
        case Rank::Ace:
            return "A";
    }
    return "?";
}

std::string to_string(Action a) {
    switch (a) {
        case Action::Hit:
            return "Hit";
        case Action::Stand:
            return "Stand";
        case Action::Double:
            return "Double";
        case Action::Split:
            return "Split";
    }
    return "Unknown";
}

std::string to_string(BetAdvice advice) {
    switch (advice) {
        case BetAdvice::Increase:
            return "Increase";
        case BetAdvice::SlightAdvantage:
            return "SlightAdvantage";
        case BetAdvice::Minimum:
            return "Minimum";
    }
    return "Unknown";
}

std::string describe(BetAdvice advice) {
    switch (advice) {
        case BetAdvice::Increase:
            return "High count - Increase bet";
        case BetAdvice::SlightAdvantage:
            return "Positive count - Slight advantage, normal bet";
        case BetAdvice::Minimum:
            return "Neutral/Negative count - Minimum bet";
    }
    return "Unknown";
}

std::string describe(const TableRules& rules) {
    std::ostringstream os;
    os << "Monte Carlo EVs (" << rules.num_decks << "D, "
       << (rules.dealer_hits_soft_17 ? "H17" : "S17")
       << ", no DAS, no surrender)";
    return os.str();
}

} // namespace blackjack
