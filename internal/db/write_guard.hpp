#pragma once

#include <string>

#include "internal/db/api/record_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::db {

/*
  Commit-phase helpers.

  Once an operation starts writing, any non-OK store result becomes
  StoreWriteFailure: earlier writes of the same operation may already be
  visible, so the failure is never retried or swallowed.
*/

inline void RequireWrite(const Result& result, const std::string& what) {
  if (result) return;
  BACKOFFICE_LOG_ERROR("record store write failed", {observability::StringField("write", what), observability::StringField("code", ErrorCodeName(result.code)),
                                                     observability::StringField("error", result.message)});
  throw util::StoreWriteFailure(what + " failed (" + ErrorCodeName(result.code) + "): " + result.message + "; transaction may not have completed");
}

inline Row RequireUpdate(UpdateOutcome outcome, const std::string& what) {
  RequireWrite(outcome.result, what);
  return std::move(outcome.after);
}

} // namespace backoffice::db
