#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  InsufficientFunds,
  InsufficientHoldings,
  InvalidStake,
  InvalidSelection,
  BettingClosed,
  AlreadySettled,
  StaleOffer,
  NotFound,
  NotAuthorized,
  AgeVerificationRequired,
  InvalidArgument,
  Storage,
};

inline const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InsufficientFunds:
    return "insufficient_funds";
  case ErrorKind::InsufficientHoldings:
    return "insufficient_holdings";
  case ErrorKind::InvalidStake:
    return "invalid_stake";
  case ErrorKind::InvalidSelection:
    return "invalid_selection";
  case ErrorKind::BettingClosed:
    return "betting_closed";
  case ErrorKind::AlreadySettled:
    return "already_settled";
  case ErrorKind::StaleOffer:
    return "stale_offer";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::NotAuthorized:
    return "not_authorized";
  case ErrorKind::AgeVerificationRequired:
    return "age_verification_required";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  case ErrorKind::Storage:
    return "storage";
  }
  return "unknown";
}

// 所有业务错误都通过该异常抛出; 在 Database::transact 内抛出即整体回滚
class LedgerError : public std::runtime_error {
public:
  LedgerError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  const char *kind_name() const { return error_kind_name(kind_); }

private:
  ErrorKind kind_;
};
