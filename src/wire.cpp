#include "blackjack/wire.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace blackjack::wire {

namespace {

// Position just past the ':' that follows "key", with spaces skipped.
std::optional<std::size_t> value_start(const std::string& body, const std::string& key) {
    const auto pos = body.find("\"" + key + "\"");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    const auto colon = body.find(':', pos + key.size() + 2);
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    std::size_t i = colon + 1;
    while (i < body.size() && (body[i] == ' ' || body[i] == '\t' || body[i] == '\r' || body[i] == '\n')) {
        ++i;
    }
    if (i >= body.size()) {
        return std::nullopt;
    }
    return i;
}

bool is_token_end(char c) {
    return c == ',' || c == '}' || c == ']' || c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '"') {
            out += "\\\"";
        } else if (c == '\n') {
            out += "\\n";
        } else if (static_cast<unsigned char>(c) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out += buf;
        } else {
            out += c;
        }
    }
    return out;
}

std::string deal_to_json(const DealResult& r) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "{";
    os << "\"running_count\":" << r.running_count << ",";
    os << "\"true_count\":" << r.true_count << ",";
    os << "\"remaining_decks\":" << r.remaining_decks;
    os << "}";
    return os.str();
}

std::string status_to_json(const ShoeStatus& s) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "{";
    os << "\"num_decks\":" << s.num_decks << ",";
    os << "\"running_count\":" << s.running_count << ",";
    os << "\"true_count\":" << s.true_count << ",";
    os << "\"remaining_cards\":" << s.remaining_cards << ",";
    os << "\"remaining_decks\":" << s.remaining_decks << ",";
    os << "\"cards_dealt\":" << s.cards_dealt << ",";
    os << "\"penetration\":" << s.penetration << ",";
    os << "\"composition\":{";
    for (std::size_t i = 0; i < kRankCount; ++i) {
        if (i) {
            os << ",";
        }
        os << "\"" << to_string(kAllRanks[i]) << "\":" << s.composition[i];
    }
    os << "}";
    os << "}";
    return os.str();
}

std::string betting_to_json(BetAdvice advice) {
    std::ostringstream os;
    os << "{";
    os << "\"advice\":\"" << to_string(advice) << "\",";
    os << "\"text\":\"" << json_escape(describe(advice)) << "\"";
    os << "}";
    return os.str();
}

std::string evaluation_to_json(const Evaluation& e) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);
    os << "{";
    for (const auto& est : e.estimates) {
        os << "\"" << to_string(est.action) << "\":" << est.ev << ",";
    }
    os << "\"Best\":\"" << to_string(e.best) << "\",";
    os << "\"BasicStrategy\":\"" << to_string(e.basic_strategy) << "\",";
    os << "\"Info\":\"" << json_escape(e.info) << "\",";
    os << "\"aborted_trials\":" << e.aborted_trials();
    os << "}";
    return os.str();
}

std::string error_to_json(const std::string& message) {
    return "{\"error\":\"" + json_escape(message) + "\"}";
}

std::optional<std::string> find_string_field(const std::string& body, const std::string& key) {
    const auto start = value_start(body, key);
    if (!start) {
        return std::nullopt;
    }

    std::size_t i = *start;
    std::string out;
    if (body[i] != '"') {
        while (i < body.size() && !is_token_end(body[i])) {
            out += body[i];
            ++i;
        }
        if (out.empty()) {
            return std::nullopt;
        }
        return out;
    }

    ++i;
    while (i < body.size() && body[i] != '"') {
        if (body[i] == '\\' && i + 1 < body.size()) {
            ++i;
        }
        out += body[i];
        ++i;
    }
    if (i >= body.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<int> find_int_field(const std::string& body, const std::string& key) {
    const auto start = value_start(body, key);
    if (!start) {
        return std::nullopt;
    }

    std::size_t i = *start;
    bool neg = false;
    if (body[i] == '-') {
        neg = true;
        ++i;
    }
    if (i >= body.size() || body[i] < '0' || body[i] > '9') {
        return std::nullopt;
    }
    long long val = 0;
    while (i < body.size() && body[i] >= '0' && body[i] <= '9') {
        val = val * 10 + (body[i] - '0');
        if (val > 1000000000LL) {
            return std::nullopt;
        }
        ++i;
    }
    if (i < body.size() && !is_token_end(body[i])) {
        return std::nullopt;
    }
    return static_cast<int>(neg ? -val : val);
}

std::optional<bool> find_bool_field(const std::string& body, const std::string& key) {
    const auto start = value_start(body, key);
    if (!start) {
        return std::nullopt;
    }
    if (body.compare(*start, 4, "true") == 0) {
        return true;
    }
    if (body.compare(*start, 5, "false") == 0) {
        return false;
    }
    return std::nullopt;
}

} // namespace blackjack::wire
