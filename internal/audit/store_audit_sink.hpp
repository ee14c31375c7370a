#pragma once

#include "internal/audit/audit_sink.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/util/time.hpp"

namespace backoffice::audit {

// Appends to the audit_log collection. Ids are random UUIDs so recording
// needs no mutation lock.
class StoreAuditSink final : public AuditSink {
 public:
  explicit StoreAuditSink(db::RecordStore& store, util::NowFn now = util::Now);

  void Record(const AuditEvent& event) override;

 private:
  db::RecordStore& store_;
  util::NowFn      now_;
};

} // namespace backoffice::audit
