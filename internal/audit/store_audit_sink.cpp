#include "store_audit_sink.hpp"

#include <stdexcept>

#include "internal/db/schema/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace backoffice::audit {

StoreAuditSink::StoreAuditSink(db::RecordStore& store, util::NowFn now) : store_(store), now_(std::move(now)) {
}

void StoreAuditSink::Record(const AuditEvent& event) {
  db::Row row{{"audit_id", util::ToString(util::GenerateUUID())},
              {"at", util::FormatTimestamp(now_())},
              {"user", event.user},
              {"module", event.module},
              {"action", event.action},
              {"details", event.details},
              {"before", event.before},
              {"after", event.after}};

  auto result = store_.AppendRows(db::schema::kAuditLog, {row});
  if (!result) {
    throw std::runtime_error("audit append failed (" + std::string(db::ErrorCodeName(result.code)) + "): " + result.message);
  }
}

} // namespace backoffice::audit
