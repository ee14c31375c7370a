#include "audit_sink.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace backoffice::audit {

void Emit(AuditSink& sink, const AuditEvent& event) {
  try {
    sink.Record(event);
  } catch (const std::exception& e) {
    BACKOFFICE_LOG_WARN("audit record failed", {observability::StringField("module", event.module), observability::StringField("action", event.action),
                                                observability::StringField("error", e.what())});
  }
}

} // namespace backoffice::audit
