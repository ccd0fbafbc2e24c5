#include "core/errors.hpp"

namespace perpx {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unauthorized:          return "Unauthorized";
        case ErrorCode::InvalidVenue:          return "InvalidVenue";
        case ErrorCode::InvalidLeverage:       return "InvalidLeverage";
        case ErrorCode::InvalidOracle:         return "InvalidOracle";
        case ErrorCode::InvalidMarket:         return "InvalidMarket";
        case ErrorCode::InvalidMargin:         return "InvalidMargin";
        case ErrorCode::InvalidPositionSize:   return "InvalidPositionSize";
        case ErrorCode::InvalidOwner:          return "InvalidOwner";
        case ErrorCode::AlreadyRegistered:     return "AlreadyRegistered";
        case ErrorCode::NotRegistered:         return "NotRegistered";
        case ErrorCode::Paused:                return "Paused";
        case ErrorCode::DeadlineExpired:       return "DeadlineExpired";
        case ErrorCode::OracleNotSet:          return "OracleNotSet";
        case ErrorCode::StalePrice:            return "StalePrice";
        case ErrorCode::InvalidPrice:          return "InvalidPrice";
        case ErrorCode::OracleUnavailable:     return "OracleUnavailable";
        case ErrorCode::PriceDeviationTooHigh: return "PriceDeviationTooHigh";
        case ErrorCode::NoActiveVenues:        return "NoActiveVenues";
        case ErrorCode::SlippageExceeded:      return "SlippageExceeded";
        case ErrorCode::ReentrantCall:         return "ReentrantCall";
        case ErrorCode::VenueCallFailed:       return "VenueCallFailed";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authorization: return "Authorization";
        case ErrorKind::Validation:    return "Validation";
        case ErrorKind::StateConflict: return "StateConflict";
        case ErrorKind::Temporal:      return "Temporal";
        case ErrorKind::MarketData:    return "MarketData";
        case ErrorKind::Liquidity:     return "Liquidity";
        case ErrorKind::Economic:      return "Economic";
        case ErrorKind::Reentrancy:    return "Reentrancy";
        case ErrorKind::Execution:     return "Execution";
    }
    return "Unknown";
}

ErrorKind kind_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unauthorized:
            return ErrorKind::Authorization;
        case ErrorCode::InvalidVenue:
        case ErrorCode::InvalidLeverage:
        case ErrorCode::InvalidOracle:
        case ErrorCode::InvalidMarket:
        case ErrorCode::InvalidMargin:
        case ErrorCode::InvalidPositionSize:
        case ErrorCode::InvalidOwner:
            return ErrorKind::Validation;
        case ErrorCode::AlreadyRegistered:
        case ErrorCode::NotRegistered:
        case ErrorCode::Paused:
            return ErrorKind::StateConflict;
        case ErrorCode::DeadlineExpired:
            return ErrorKind::Temporal;
        case ErrorCode::OracleNotSet:
        case ErrorCode::StalePrice:
        case ErrorCode::InvalidPrice:
        case ErrorCode::OracleUnavailable:
        case ErrorCode::PriceDeviationTooHigh:
            return ErrorKind::MarketData;
        case ErrorCode::NoActiveVenues:
            return ErrorKind::Liquidity;
        case ErrorCode::SlippageExceeded:
            return ErrorKind::Economic;
        case ErrorCode::ReentrantCall:
            return ErrorKind::Reentrancy;
        case ErrorCode::VenueCallFailed:
            return ErrorKind::Execution;
    }
    return ErrorKind::Execution;
}

RouterError::RouterError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail)
    , code_(code) {}

SlippageError::SlippageError(Amount realized, Amount min_out, bool compensated)
    : RouterError(ErrorCode::SlippageExceeded,
                  "realized " + format_amount(realized) + " < min " + format_amount(min_out)
                  + (compensated ? " (compensated)" : ""))
    , realized_(realized)
    , min_out_(min_out)
    , compensated_(compensated) {}

} // namespace perpx
