#pragma once

#include "backoffice/v1/backoffice.pb.h"

namespace backoffice::v1 {

// Convenience aggregation header for public request/response messages.

} // namespace backoffice::v1
