#include "blackjack/advisor.hpp"
#include "blackjack/strategy.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Options {
    blackjack::TableRules rules;
    blackjack::SimulationConfig sim;
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--decks N] [--trials N] [--seed N] [--threads N] [--h17]\n";
}

bool parse_positive(const char* text, long long& out) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v < 1) {
        return false;
    }
    out = v;
    return true;
}

bool parse_options(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--h17") {
            opt.rules.dealer_hits_soft_17 = true;
            continue;
        }
        if (i + 1 >= argc) {
            return false;
        }
        long long v = 0;
        if (!parse_positive(argv[++i], v)) {
            return false;
        }
        if (flag == "--decks" && v <= blackjack::kMaxDecks) {
            opt.rules.num_decks = static_cast<int>(v);
        } else if (flag == "--trials" && v <= 100000000) {
            opt.sim.trials_per_action = static_cast<int>(v);
        } else if (flag == "--seed") {
            opt.sim.seed = static_cast<std::uint64_t>(v);
        } else if (flag == "--threads" && v <= 256) {
            opt.sim.worker_threads = static_cast<int>(v);
        } else {
            return false;
        }
    }
    return true;
}

std::string read_line_with_prompt(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return "";
    }
    return line;
}

int read_int_with_prompt(const std::string& prompt, int min_v, int max_v) {
    while (std::cin) {
        std::cout << prompt;
        int v = 0;
        if (std::cin >> v && v >= min_v && v <= max_v) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return v;
        }
        if (std::cin.eof()) {
            break;
        }
        std::cout << "Invalid input. Enter a number in [" << min_v << ", " << max_v << "].\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    throw std::runtime_error("input closed");
}

bool read_yes_no(const std::string& prompt) {
    const std::string answer = read_line_with_prompt(prompt);
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

std::string lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

void print_status(const blackjack::Advisor& advisor) {
    const blackjack::ShoeStatus s = advisor.get_status();
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Running count: " << s.running_count
              << ", True count: " << s.true_count
              << ", Decks: " << s.remaining_decks
              << ", Penetration: " << s.penetration * 100.0 << "%\n";
    std::cout << "Betting recommendation: " << blackjack::describe(advisor.betting_recommendation()) << "\n";
    std::cout << "Remaining:";
    for (blackjack::Rank r : blackjack::kAllRanks) {
        std::cout << " " << blackjack::to_string(r) << "=" << s.composition[blackjack::rank_index(r)];
    }
    std::cout << "\n";
}

void print_evaluation(const blackjack::Evaluation& e) {
    std::cout << "\nEV Analysis:\n";
    std::cout << std::showpos << std::fixed << std::setprecision(4);
    for (const auto& est : e.estimates) {
        std::cout << blackjack::to_string(est.action) << ": " << est.ev << "\n";
    }
    std::cout << std::noshowpos;
    std::cout << e.info << "\n";
    std::cout << "Best move -> " << blackjack::to_string(e.best) << "\n";
    std::cout << "Basic strategy -> " << blackjack::to_string(e.basic_strategy) << "\n";
    if (e.aborted_trials() > 0) {
        std::cerr << "warning: " << e.aborted_trials() << " trials aborted (deck exhausted)\n";
    }
}

void analyze_by_total(const blackjack::Advisor& advisor) {
    const int total = read_int_with_prompt("Enter player total: ", 2, 22);
    const std::string dealer = read_line_with_prompt("Enter dealer upcard (2-10,J,Q,K,A): ");
    const bool soft = read_yes_no("Soft hand? (y/n): ");
    const bool pair = read_yes_no("Pair? (y/n): ");
    print_evaluation(advisor.evaluate(total, dealer, soft, pair));
}

void analyze_by_cards(const blackjack::Advisor& advisor) {
    const std::string line = read_line_with_prompt("Enter player cards separated by spaces: ");
    std::istringstream in(line);
    std::vector<blackjack::Rank> cards;
    std::string token;
    while (in >> token) {
        cards.push_back(blackjack::parse_card_input(token));
    }
    const blackjack::Rank dealer = blackjack::parse_card_input(
        read_line_with_prompt("Enter dealer upcard (2-10,J,Q,K,A): "));

    const blackjack::HandDescriptor hand = blackjack::describe_hand(cards, dealer);
    std::cout << "Hand: " << (hand.is_pair ? "pair " : hand.is_soft ? "soft " : "hard ")
              << hand.player_total << " vs " << blackjack::to_string(dealer) << "\n";
    print_evaluation(advisor.evaluate(hand.player_total, blackjack::to_string(dealer), hand.is_soft, hand.is_pair));
}

} // namespace

int main(int argc, char** argv) {
    Options opt;
    if (!parse_options(argc, argv, opt)) {
        print_usage(argv[0]);
        return 2;
    }

    blackjack::Advisor advisor(opt.rules, opt.sim);
    std::cout << "=== Blackjack Card Counter & Strategy (" << opt.rules.num_decks << " Decks) ===\n";

    while (std::cin) {
        const std::string line = read_line_with_prompt(
            "\nEnter card, 'status', 'hand', 'cards', 'undo <card>', 'reset', or 'quit': ");
        std::istringstream in(line);
        std::string cmd;
        if (!(in >> cmd)) {
            continue;
        }
        const std::string lc = lower(cmd);

        try {
            if (lc == "quit") {
                std::cout << "Goodbye!\n";
                break;
            } else if (lc == "status") {
                print_status(advisor);
            } else if (lc == "reset") {
                advisor.reset_shoe();
                std::cout << "Shoe reset.\n";
            } else if (lc == "hand") {
                analyze_by_total(advisor);
            } else if (lc == "cards") {
                analyze_by_cards(advisor);
            } else if (lc == "undo") {
                std::string card;
                if (!(in >> card)) {
                    std::cout << "Usage: undo <card>\n";
                    continue;
                }
                const blackjack::DealResult r = advisor.restore_card(card);
                std::cout << std::fixed << std::setprecision(2)
                          << "Card " << card << " restored -> RC: " << r.running_count
                          << ", TC: " << r.true_count << ", Decks: " << r.remaining_decks << "\n";
            } else {
                const blackjack::DealResult r = advisor.deal_card(cmd);
                std::cout << std::fixed << std::setprecision(2)
                          << "Card " << cmd << " dealt -> RC: " << r.running_count
                          << ", TC: " << r.true_count << ", Decks: " << r.remaining_decks << "\n";
            }
        } catch (const std::exception& e) {
            std::cout << "Error: " << e.what() << "\n";
        }
    }

    return 0;
}
