#pragma once

#include <stdexcept>
#include <string>

namespace blackjack {

// Unknown card symbol supplied to a shoe or hand operation.
class InvalidRank : public std::invalid_argument {
public:
    explicit InvalidRank(const std::string& symbol)
        : std::invalid_argument("Invalid card: " + symbol), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// Removal of a rank whose remaining count in the live shoe is zero.
class ShoeExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A simulation working deck ran dry in the middle of a trial.
class DeckExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Restoration of a rank that is already at its full-shoe count.
class CardNotDealt : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace blackjack
