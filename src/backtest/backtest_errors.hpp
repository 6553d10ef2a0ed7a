#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Error kinds raised by the backtest pipeline. Each maps onto the standard
// exception that best describes it so callers can catch either level.
// ---------------------------------------------------------------------------

// Metrics or chart data requested before a run completed.
class StateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Window sizes, cost rate or series construction arguments out of range.
class InvalidParameterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Return ratio requested against a non-positive price.
class DomainError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// Series too short to leave any row after warm-up.
class InsufficientDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
