#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace backoffice::model {

enum class PaymentMode : std::uint8_t {
  kCash   = 1,
  kBank   = 2,
  kMobile = 3,
  kCredit = 4,
};

constexpr std::string_view ToString(PaymentMode mode) {
  switch (mode) {
    case PaymentMode::kCash:
      return "Cash";
    case PaymentMode::kBank:
      return "Bank";
    case PaymentMode::kMobile:
      return "Mobile";
    case PaymentMode::kCredit:
      return "Credit";
  }
  return "unknown";
}

constexpr std::optional<PaymentMode> ParsePaymentMode(std::string_view text) {
  if (text == "Cash") return PaymentMode::kCash;
  if (text == "Bank") return PaymentMode::kBank;
  if (text == "Mobile") return PaymentMode::kMobile;
  if (text == "Credit") return PaymentMode::kCredit;
  return std::nullopt;
}

// Ledger account debited when a sale is paid in `mode`.
constexpr std::string_view LedgerAccount(PaymentMode mode) {
  return mode == PaymentMode::kCredit ? std::string_view("Accounts Receivable") : ToString(mode);
}

// ---------------------------------------------------------------------------
// Sale status
// ---------------------------------------------------------------------------

enum class SaleStatus : std::uint8_t {
  kCompleted         = 1,
  kCancelled         = 2,
  kPartiallyReturned = 3,
  kReturned          = 4,
};

constexpr std::string_view ToString(SaleStatus status) {
  switch (status) {
    case SaleStatus::kCompleted:
      return "Completed";
    case SaleStatus::kCancelled:
      return "Cancelled";
    case SaleStatus::kPartiallyReturned:
      return "PartiallyReturned";
    case SaleStatus::kReturned:
      return "Returned";
  }
  return "unknown";
}

constexpr std::optional<SaleStatus> ParseSaleStatus(std::string_view text) {
  if (text == "Completed") return SaleStatus::kCompleted;
  if (text == "Cancelled") return SaleStatus::kCancelled;
  if (text == "PartiallyReturned") return SaleStatus::kPartiallyReturned;
  if (text == "Returned") return SaleStatus::kReturned;
  return std::nullopt;
}

constexpr bool CanTransition(SaleStatus from, SaleStatus to) {
  switch (from) {
    case SaleStatus::kCompleted:
      return to == SaleStatus::kCancelled || to == SaleStatus::kPartiallyReturned || to == SaleStatus::kReturned;
    case SaleStatus::kPartiallyReturned:
      return to == SaleStatus::kPartiallyReturned || to == SaleStatus::kReturned;
    case SaleStatus::kCancelled:
    case SaleStatus::kReturned:
      return false;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Quotation status
// ---------------------------------------------------------------------------

enum class QuotationStatus : std::uint8_t {
  kDraft     = 1,
  kPending   = 2,
  kAccepted  = 3,
  kRejected  = 4,
  kConverted = 5,
  kDeleted   = 6,
};

constexpr std::string_view ToString(QuotationStatus status) {
  switch (status) {
    case QuotationStatus::kDraft:
      return "Draft";
    case QuotationStatus::kPending:
      return "Pending";
    case QuotationStatus::kAccepted:
      return "Accepted";
    case QuotationStatus::kRejected:
      return "Rejected";
    case QuotationStatus::kConverted:
      return "Converted";
    case QuotationStatus::kDeleted:
      return "Deleted";
  }
  return "unknown";
}

constexpr std::optional<QuotationStatus> ParseQuotationStatus(std::string_view text) {
  if (text == "Draft") return QuotationStatus::kDraft;
  if (text == "Pending") return QuotationStatus::kPending;
  if (text == "Accepted") return QuotationStatus::kAccepted;
  if (text == "Rejected") return QuotationStatus::kRejected;
  if (text == "Converted") return QuotationStatus::kConverted;
  if (text == "Deleted") return QuotationStatus::kDeleted;
  return std::nullopt;
}

constexpr bool IsTerminal(QuotationStatus status) {
  return status == QuotationStatus::kConverted || status == QuotationStatus::kDeleted || status == QuotationStatus::kRejected;
}

constexpr bool CanConvert(QuotationStatus status) {
  return status == QuotationStatus::kPending || status == QuotationStatus::kAccepted;
}

// Manual status changes. Conversion and deletion have their own operations.
constexpr bool CanTransition(QuotationStatus from, QuotationStatus to) {
  switch (from) {
    case QuotationStatus::kDraft:
      return to == QuotationStatus::kPending;
    case QuotationStatus::kPending:
      return to == QuotationStatus::kAccepted || to == QuotationStatus::kRejected;
    case QuotationStatus::kAccepted:
    case QuotationStatus::kRejected:
    case QuotationStatus::kConverted:
    case QuotationStatus::kDeleted:
      return false;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Stock batch origin
// ---------------------------------------------------------------------------

enum class BatchSource : std::uint8_t {
  kPurchase = 1,
  kOpening  = 2,
  kReturn   = 3,
  kRestore  = 4,
};

constexpr std::string_view ToString(BatchSource source) {
  switch (source) {
    case BatchSource::kPurchase:
      return "PURCHASE";
    case BatchSource::kOpening:
      return "OPENING";
    case BatchSource::kReturn:
      return "RETURN";
    case BatchSource::kRestore:
      return "RESTORE";
  }
  return "unknown";
}

constexpr std::optional<BatchSource> ParseBatchSource(std::string_view text) {
  if (text == "PURCHASE") return BatchSource::kPurchase;
  if (text == "OPENING") return BatchSource::kOpening;
  if (text == "RETURN") return BatchSource::kReturn;
  if (text == "RESTORE") return BatchSource::kRestore;
  return std::nullopt;
}

inline constexpr std::string_view kActive   = "Active";
inline constexpr std::string_view kInactive = "Inactive";

} // namespace backoffice::model
