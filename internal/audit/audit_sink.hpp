#pragma once

#include <string>

namespace backoffice::audit {

struct AuditEvent {
  std::string user;
  std::string module;
  std::string action;
  std::string details;
  std::string before;
  std::string after;
};

/*
  Audit collaborator.

  Record may throw; pipelines call it through Emit, which logs failures at
  warn level and never lets them fail the business operation.
*/
class AuditSink {
 public:
  virtual ~AuditSink() = default;

  virtual void Record(const AuditEvent& event) = 0;
};

void Emit(AuditSink& sink, const AuditEvent& event);

} // namespace backoffice::audit
