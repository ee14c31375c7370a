#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace backoffice::sales {

enum class PipelineState : std::uint8_t {
  kValidating,
  kLocked,
  kCommitting,
  kInvalidating,
  kAuditing,
  kDone,
  kAborted,
};

constexpr std::string_view ToString(PipelineState state) {
  switch (state) {
    case PipelineState::kValidating:
      return "Validating";
    case PipelineState::kLocked:
      return "Locked";
    case PipelineState::kCommitting:
      return "Committing";
    case PipelineState::kInvalidating:
      return "Invalidating";
    case PipelineState::kAuditing:
      return "Auditing";
    case PipelineState::kDone:
      return "Done";
    case PipelineState::kAborted:
      return "Aborted";
  }
  return "unknown";
}

/*
  Tracks one pipeline operation through its states and logs each change at
  debug level. Leaving scope before Done logs the abort: at debug level
  while nothing was written, at error level once the commit had started.
*/
class OperationTrace {
 public:
  explicit OperationTrace(std::string operation);
  ~OperationTrace();

  OperationTrace(const OperationTrace&)            = delete;
  OperationTrace& operator=(const OperationTrace&) = delete;

  void Enter(PipelineState state);

  // Transaction id once allocated, or the target id for cancel/convert.
  void SetSubject(std::string subject);

  PipelineState State() const {
    return state_;
  }

 private:
  std::string   operation_;
  std::string   subject_;
  PipelineState state_ = PipelineState::kValidating;
  bool          commit_started_ = false;
};

} // namespace backoffice::sales
