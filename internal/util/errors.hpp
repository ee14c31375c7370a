#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/util/numeric.hpp"

namespace backoffice::util {

/*
  Central error types.

  Business and validation errors are raised before anything is written.
  StoreWriteFailure is the only error raised after a commit began; callers
  must treat it as "transaction may not have completed".

  These get translated later to gRPC status codes.
*/

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Mutation lock could not be acquired within the bounded wait. Nothing was
// written, so the caller may retry with backoff.
class Busy : public std::runtime_error {
 public:
  explicit Busy(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientStock : public std::runtime_error {
 public:
  InsufficientStock(std::string item_id, std::int64_t requested, std::int64_t available)
      : std::runtime_error("insufficient stock for item " + item_id + ": requested " + std::to_string(requested) + ", available " +
                           std::to_string(available)),
        item_id_(std::move(item_id)),
        requested_(requested),
        available_(available) {
  }

  const std::string& item_id() const {
    return item_id_;
  }
  std::int64_t requested() const {
    return requested_;
  }
  std::int64_t available() const {
    return available_;
  }

 private:
  std::string  item_id_;
  std::int64_t requested_;
  std::int64_t available_;
};

class CreditLimitExceeded : public std::runtime_error {
 public:
  CreditLimitExceeded(std::string customer_id, Cents balance, Cents limit, Cents amount)
      : std::runtime_error("credit limit exceeded for customer " + customer_id + ": balance " + FormatMoney(balance) + " + sale " +
                           FormatMoney(amount) + " > limit " + FormatMoney(limit)),
        customer_id_(std::move(customer_id)),
        balance_(balance),
        limit_(limit),
        amount_(amount) {
  }

  const std::string& customer_id() const {
    return customer_id_;
  }
  Cents balance() const {
    return balance_;
  }
  Cents limit() const {
    return limit_;
  }
  Cents amount() const {
    return amount_;
  }

 private:
  std::string customer_id_;
  Cents       balance_;
  Cents       limit_;
  Cents       amount_;
};

// The record store rejected a write after the commit step began. Earlier
// writes of the same operation may already be visible; reconcile from the
// store.
class StoreWriteFailure : public std::runtime_error {
 public:
  explicit StoreWriteFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace backoffice::util
