#pragma once

#include <cstdint>
#include <string>

#include "internal/core/core_context.hpp"
#include "internal/model/status.hpp"
#include "internal/util/numeric.hpp"

namespace backoffice::catalog {

using util::Cents;

struct AddItemRequest {
  std::string  name;
  std::string  category;
  Cents        unit_price    = 0;
  std::int64_t reorder_level = 0;
  std::int64_t opening_qty   = 0; // optional opening stock batch
  Cents        opening_cost  = 0;
  std::string  user;
};

struct AddItemResult {
  std::string item_id;
  std::string batch_id; // empty without opening stock
};

struct AddCustomerRequest {
  std::string name;
  std::string phone;
  std::string email;
  Cents       credit_limit = 0;
  std::string user;
};

struct AddSupplierRequest {
  std::string name;
  std::string phone;
  std::string email;
  std::string user;
};

struct ReceiveStockRequest {
  std::string        item_id;
  std::int64_t       qty       = 0;
  Cents              unit_cost = 0;
  std::string        supplier_id; // required for credit purchases
  model::PaymentMode payment_mode = model::PaymentMode::kCash;
  std::string        user;
};

struct ReceiveStockResult {
  std::string purchase_id;
  std::string batch_id;
  Cents       total_cost = 0;
};

struct CustomerPaymentRequest {
  std::string        customer_id;
  Cents              amount  = 0;
  model::PaymentMode account = model::PaymentMode::kCash;
  std::string        user;
};

struct CustomerPaymentResult {
  std::string entry_id;
  Cents       balance_after = 0;
};

/*
  Registration of items, customers and suppliers, stock receipts and
  customer payments.

  Same discipline as the sale pipeline: validate, lock, allocate ids,
  persist, unlock, invalidate, audit.
*/
class CatalogManager {
 public:
  explicit CatalogManager(core::CoreContext ctx);

  AddItemResult AddItem(const AddItemRequest& request);

  std::string AddCustomer(const AddCustomerRequest& request);

  std::string AddSupplier(const AddSupplierRequest& request);

  ReceiveStockResult ReceiveStock(const ReceiveStockRequest& request);

  CustomerPaymentResult RecordCustomerPayment(const CustomerPaymentRequest& request);

 private:
  void Audit(const std::string& user, const std::string& module, const std::string& action, const std::string& details, const std::string& before,
             const std::string& after);

  core::CoreContext ctx_;
};

} // namespace backoffice::catalog
