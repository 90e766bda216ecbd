#pragma once

#include "blackjack/shoe.hpp"
#include "blackjack/simulator.hpp"

#include <optional>
#include <string>

namespace blackjack::wire {

std::string json_escape(const std::string& in);

std::string deal_to_json(const DealResult& r);
std::string status_to_json(const ShoeStatus& s);
std::string betting_to_json(BetAdvice advice);

// {"Hit": ev, ..., "Best": "...", "BasicStrategy": "...", "Info": "...", "aborted_trials": n}
std::string evaluation_to_json(const Evaluation& e);

std::string error_to_json(const std::string& message);

// Flat-object field lookup on a request body. Missing or malformed -> nullopt.
// String lookup also accepts a bare token, so "dealer_upcard": 10 reads as "10".
std::optional<std::string> find_string_field(const std::string& body, const std::string& key);
std::optional<int> find_int_field(const std::string& body, const std::string& key);
std::optional<bool> find_bool_field(const std::string& body, const std::string& key);

} // namespace blackjack::wire
