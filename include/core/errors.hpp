#pragma once

#include "core/fixed_point.hpp"

#include <stdexcept>
#include <string>

namespace perpx {

enum class ErrorKind {
    Authorization,
    Validation,
    StateConflict,
    Temporal,
    MarketData,
    Liquidity,
    Economic,
    Reentrancy,
    Execution,
};

enum class ErrorCode {
    // Authorization
    Unauthorized,
    // Validation
    InvalidVenue,
    InvalidLeverage,
    InvalidOracle,
    InvalidMarket,
    InvalidMargin,
    InvalidPositionSize,
    InvalidOwner,
    // State conflict
    AlreadyRegistered,
    NotRegistered,
    Paused,
    // Temporal
    DeadlineExpired,
    // Market data
    OracleNotSet,
    StalePrice,
    InvalidPrice,
    OracleUnavailable,
    PriceDeviationTooHigh,
    // Liquidity
    NoActiveVenues,
    // Economic
    SlippageExceeded,
    // Reentrancy
    ReentrantCall,
    // Execution
    VenueCallFailed,
};

const char* to_string(ErrorCode code);
const char* to_string(ErrorKind kind);
ErrorKind kind_of(ErrorCode code);

// Every failure surfaced by the router and its registries.
class RouterError : public std::runtime_error {
public:
    RouterError(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return kind_of(code_); }

private:
    ErrorCode code_;
};

// Raised after the venue-side trade already happened.
class SlippageError : public RouterError {
public:
    SlippageError(Amount realized, Amount min_out, bool compensated);

    Amount realized()    const { return realized_; }
    Amount min_out()     const { return min_out_; }
    bool   compensated() const { return compensated_; }

private:
    Amount realized_;
    Amount min_out_;
    bool   compensated_;
};

} // namespace perpx
