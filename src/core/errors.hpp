#pragma once

#include <stdexcept>
#include <string>

namespace strategy_sim {

/**
 * Base of every error raised by the backtesting core.
 */
class SimError : public std::runtime_error {
public:
    explicit SimError(const std::string& what) : std::runtime_error(what) {}
};

// Bad strategy configuration; raised at construction.
class InvalidParameters : public SimError {
public:
    explicit InvalidParameters(const std::string& what) : SimError(what) {}
};

// Missing column, unordered or duplicate dates, non-positive order values.
class InvalidInput : public SimError {
public:
    explicit InvalidInput(const std::string& what) : SimError(what) {}
};

class InsufficientFunds : public SimError {
public:
    InsufficientFunds(double required, double available)
        : SimError("insufficient funds: required " + std::to_string(required) +
                   ", available " + std::to_string(available)),
          required_(required), available_(available) {}

    double required() const { return required_; }
    double available() const { return available_; }

private:
    double required_;
    double available_;
};

class InsufficientPosition : public SimError {
public:
    InsufficientPosition(const std::string& symbol, double requested, double held)
        : SimError("insufficient position in " + symbol + ": requested " +
                   std::to_string(requested) + ", held " + std::to_string(held)),
          requested_(requested), held_(held) {}

    double requested() const { return requested_; }
    double held() const { return held_; }

private:
    double requested_;
    double held_;
};

class UnknownPosition : public SimError {
public:
    explicit UnknownPosition(const std::string& symbol)
        : SimError("no position held in " + symbol) {}
};

// Upstream provider returned nothing for the requested range.
class DataUnavailable : public SimError {
public:
    explicit DataUnavailable(const std::string& what) : SimError(what) {}
};

} // namespace strategy_sim
