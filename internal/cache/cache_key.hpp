#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace backoffice::cache {

enum class CacheFamily : std::uint8_t {
  kInventory  = 0,
  kCustomers  = 1,
  kSuppliers  = 2,
  kSales      = 3,
  kQuotations = 4,
  kDashboard  = 5,
  kReference  = 6,
};

inline constexpr std::size_t kFamilyCount = 7;

constexpr std::string_view ToString(CacheFamily family) {
  switch (family) {
    case CacheFamily::kInventory:
      return "inventory";
    case CacheFamily::kCustomers:
      return "customers";
    case CacheFamily::kSuppliers:
      return "suppliers";
    case CacheFamily::kSales:
      return "sales";
    case CacheFamily::kQuotations:
      return "quotations";
    case CacheFamily::kDashboard:
      return "dashboard";
    case CacheFamily::kReference:
      return "reference";
  }
  return "unknown";
}

struct CacheKey {
  CacheFamily family;
  std::string name;

  // "family:name"
  std::string Render() const {
    return std::string(ToString(family)) + ":" + name;
  }

  bool operator==(const CacheKey&) const = default;
};

// ---------------------------------------------------------------------------
// Invalidation sets, one per mutating operation
// ---------------------------------------------------------------------------

using F = CacheFamily;

inline constexpr std::array kSaleInvalidations             = {F::kSales, F::kInventory, F::kDashboard};
inline constexpr std::array kCustomerSaleInvalidations     = {F::kSales, F::kInventory, F::kDashboard, F::kCustomers};
inline constexpr std::array kQuotationInvalidations        = {F::kQuotations};
inline constexpr std::array kConversionInvalidations       = {F::kSales, F::kInventory, F::kDashboard, F::kQuotations};
inline constexpr std::array kCustomerConversionInvalidations = {F::kSales, F::kInventory, F::kDashboard, F::kQuotations, F::kCustomers};
inline constexpr std::array kItemInvalidations             = {F::kInventory, F::kReference, F::kDashboard};
inline constexpr std::array kCustomerInvalidations         = {F::kCustomers};
inline constexpr std::array kSupplierInvalidations         = {F::kSuppliers};
inline constexpr std::array kReceiptInvalidations          = {F::kInventory, F::kSuppliers, F::kDashboard};
inline constexpr std::array kPaymentInvalidations          = {F::kCustomers, F::kDashboard};

} // namespace backoffice::cache
