#include "operation_trace.hpp"

#include "internal/observability/logging.hpp"

namespace backoffice::sales {

using observability::StringField;

OperationTrace::OperationTrace(std::string operation) : operation_(std::move(operation)) {
  BACKOFFICE_LOG_DEBUG("pipeline state", {StringField("operation", operation_), StringField("state", ToString(state_))});
}

OperationTrace::~OperationTrace() {
  if (state_ == PipelineState::kDone) return;

  const auto from = ToString(state_);
  state_          = PipelineState::kAborted;
  if (commit_started_) {
    BACKOFFICE_LOG_ERROR("pipeline failed after commit began",
                         {StringField("operation", operation_), StringField("subject", subject_), StringField("from", from)});
  } else {
    BACKOFFICE_LOG_DEBUG("pipeline state", {StringField("operation", operation_), StringField("subject", subject_), StringField("from", from),
                                            StringField("state", ToString(state_))});
  }
}

void OperationTrace::Enter(PipelineState state) {
  if (state == PipelineState::kCommitting) commit_started_ = true;
  BACKOFFICE_LOG_DEBUG("pipeline state", {StringField("operation", operation_), StringField("subject", subject_), StringField("from", ToString(state_)),
                                          StringField("state", ToString(state))});
  state_ = state;
}

void OperationTrace::SetSubject(std::string subject) {
  subject_ = std::move(subject);
}

} // namespace backoffice::sales
