#include "catalog_manager.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <span>

#include "internal/audit/audit_sink.hpp"
#include "internal/cache/query_cache.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/db/schema/collections.hpp"
#include "internal/db/write_guard.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/lock/mutation_lock.hpp"
#include "internal/model/records.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sequence/sequence_allocator.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::catalog {

using observability::IntField;
using observability::MoneyField;
using observability::StringField;
using sequence::EntityType;

namespace {

std::string UserOrSystem(const std::string& user) {
  return user.empty() ? std::string("system") : user;
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Runs the writes, releases the lock, invalidates, then rethrows a write failure.
template <typename Write>
void CommitAndInvalidate(lock::Guard& guard, cache::QueryCache& cache, std::span<const cache::CacheFamily> families, Write&& write) {
  std::exception_ptr failure;
  try {
    write();
  } catch (const util::StoreWriteFailure&) {
    failure = std::current_exception();
  }
  guard.Release();

  try {
    cache.Invalidate(families);
  } catch (const std::exception& e) {
    BACKOFFICE_LOG_ERROR("cache invalidation failed", {StringField("error", e.what())});
  }
  if (failure) std::rethrow_exception(failure);
}

} // namespace

CatalogManager::CatalogManager(core::CoreContext ctx) : ctx_(std::move(ctx)) {
}

void CatalogManager::Audit(const std::string& user, const std::string& module, const std::string& action, const std::string& details,
                           const std::string& before, const std::string& after) {
  audit::Emit(*ctx_.audit, audit::AuditEvent{user, module, action, details, before, after});
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------

AddItemResult CatalogManager::AddItem(const AddItemRequest& request) {
  if (request.name.empty()) throw util::InvalidInput("item name is required");
  if (request.unit_price < 0) throw util::InvalidInput("unit price must not be negative");
  if (request.reorder_level < 0) throw util::InvalidInput("reorder level must not be negative");
  if (request.opening_qty < 0) throw util::InvalidInput("opening quantity must not be negative");
  if (request.opening_cost < 0) throw util::InvalidInput("opening cost must not be negative");
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("AddItem");

  for (const auto& row : ctx_.store->Scan(db::schema::kItems)) {
    if (Lower(db::Cell(row, "name")) == Lower(request.name)) {
      throw util::AlreadyExists("item named '" + request.name + "' already exists as " + db::Cell(row, "item_id"));
    }
  }

  model::Item item;
  item.item_id       = ctx_.sequences->NextId(guard, EntityType::kItem);
  item.name          = request.name;
  item.category      = request.category;
  item.unit_price    = request.unit_price;
  item.last_cost     = request.opening_cost;
  item.reorder_level = request.reorder_level;
  item.created_at    = util::FormatTimestamp(ctx_.now());

  AddItemResult         result{item.item_id, ""};
  inventory::StockStage stage;
  if (request.opening_qty > 0) {
    result.batch_id = ctx_.inventory->Receive(guard, stage, item.item_id, request.opening_qty, request.opening_cost, model::BatchSource::kOpening,
                                              item.item_id);
    // the item row is written with its last cost already set
    stage.last_cost.erase(item.item_id);
  }

  CommitAndInvalidate(guard, *ctx_.cache, cache::kItemInvalidations, [&] {
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kItems, {model::ToRow(item)}), "append item " + item.item_id);
    ctx_.inventory->Apply(stage);
  });

  Audit(user, "Inventory", "AddItem", item.item_id + " " + item.name + " price=" + util::FormatMoney(item.unit_price), "",
        "opening_qty=" + std::to_string(request.opening_qty));
  BACKOFFICE_LOG_INFO("item added", {StringField("item_id", item.item_id), IntField("opening_qty", request.opening_qty)});
  return result;
}

std::string CatalogManager::AddCustomer(const AddCustomerRequest& request) {
  if (request.name.empty()) throw util::InvalidInput("customer name is required");
  if (request.credit_limit < 0) throw util::InvalidInput("credit limit must not be negative");
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("AddCustomer");

  model::Customer customer;
  customer.customer_id  = ctx_.sequences->NextId(guard, EntityType::kCustomer);
  customer.name         = request.name;
  customer.phone        = request.phone;
  customer.email        = request.email;
  customer.credit_limit = request.credit_limit;
  customer.created_at   = util::FormatTimestamp(ctx_.now());

  CommitAndInvalidate(guard, *ctx_.cache, cache::kCustomerInvalidations, [&] {
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kCustomers, {model::ToRow(customer)}), "append customer " + customer.customer_id);
  });

  Audit(user, "Customers", "AddCustomer", customer.customer_id + " " + customer.name, "", "credit_limit=" + util::FormatMoney(customer.credit_limit));
  BACKOFFICE_LOG_INFO("customer added", {StringField("customer_id", customer.customer_id)});
  return customer.customer_id;
}

std::string CatalogManager::AddSupplier(const AddSupplierRequest& request) {
  if (request.name.empty()) throw util::InvalidInput("supplier name is required");
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("AddSupplier");

  model::Supplier supplier;
  supplier.supplier_id = ctx_.sequences->NextId(guard, EntityType::kSupplier);
  supplier.name        = request.name;
  supplier.phone       = request.phone;
  supplier.email       = request.email;
  supplier.created_at  = util::FormatTimestamp(ctx_.now());

  CommitAndInvalidate(guard, *ctx_.cache, cache::kSupplierInvalidations, [&] {
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kSuppliers, {model::ToRow(supplier)}), "append supplier " + supplier.supplier_id);
  });

  Audit(user, "Suppliers", "AddSupplier", supplier.supplier_id + " " + supplier.name, "", "");
  BACKOFFICE_LOG_INFO("supplier added", {StringField("supplier_id", supplier.supplier_id)});
  return supplier.supplier_id;
}

// ------------------------------------------------------------
// Purchasing
// ------------------------------------------------------------

ReceiveStockResult CatalogManager::ReceiveStock(const ReceiveStockRequest& request) {
  if (request.item_id.empty()) throw util::InvalidInput("item id is required");
  if (request.qty <= 0) throw util::InvalidInput("received quantity must be positive");
  if (request.unit_cost < 0) throw util::InvalidInput("unit cost must not be negative");
  if (request.payment_mode == model::PaymentMode::kCredit && request.supplier_id.empty()) {
    throw util::InvalidInput("supplier is required for credit purchases");
  }
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("ReceiveStock");

  auto item_row = ctx_.store->FindByKey(db::schema::kItems, "item_id", request.item_id);
  if (!item_row) throw util::NotFound("item " + request.item_id + " not found");
  const auto item = model::ItemFromRow(*item_row);

  std::optional<model::Supplier> supplier;
  if (!request.supplier_id.empty()) {
    auto row = ctx_.store->FindByKey(db::schema::kSuppliers, "supplier_id", request.supplier_id);
    if (!row) throw util::NotFound("supplier " + request.supplier_id + " not found");
    supplier = model::SupplierFromRow(*row);
  }

  const auto now = util::FormatTimestamp(ctx_.now());

  model::Purchase purchase;
  purchase.purchase_id  = ctx_.sequences->NextId(guard, EntityType::kPurchase);
  purchase.supplier_id  = request.supplier_id;
  purchase.item_id      = request.item_id;
  purchase.qty          = request.qty;
  purchase.unit_cost    = request.unit_cost;
  purchase.total_cost   = request.qty * request.unit_cost;
  purchase.payment_mode = request.payment_mode;
  purchase.created_by   = user;
  purchase.created_at   = now;

  inventory::StockStage stage;
  purchase.batch_id =
      ctx_.inventory->Receive(guard, stage, request.item_id, request.qty, request.unit_cost, model::BatchSource::kPurchase, purchase.purchase_id);

  std::optional<model::LedgerEntry> payment;
  if (request.payment_mode != model::PaymentMode::kCredit) {
    payment.emplace();
    payment->entry_id     = ctx_.sequences->NextId(guard, EntityType::kLedgerEntry);
    payment->date_time    = now;
    payment->account      = std::string(model::ToString(request.payment_mode));
    payment->reference_id = purchase.purchase_id;
    payment->description  = "Purchase of " + std::to_string(request.qty) + " x " + item.name;
    payment->credit       = purchase.total_cost;
    payment->created_by   = user;
  }

  CommitAndInvalidate(guard, *ctx_.cache, cache::kReceiptInvalidations, [&] {
    ctx_.inventory->Apply(stage);
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kPurchases, {model::ToRow(purchase)}), "append purchase " + purchase.purchase_id);
    if (supplier && request.payment_mode == model::PaymentMode::kCredit) {
      db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kSuppliers, "supplier_id", supplier->supplier_id,
                                                {{"current_balance", util::FormatMoney(supplier->current_balance + purchase.total_cost)}}),
                        "update supplier " + supplier->supplier_id);
    }
    if (payment) {
      db::RequireWrite(ctx_.store->AppendRows(db::schema::kLedger, {model::ToRow(*payment)}), "append payment for " + purchase.purchase_id);
    }
  });

  Audit(user, "Purchases", "ReceiveStock",
        purchase.purchase_id + " " + request.item_id + " qty=" + std::to_string(request.qty) + " cost=" + util::FormatMoney(request.unit_cost),
        "last_cost=" + util::FormatMoney(item.last_cost), "last_cost=" + util::FormatMoney(request.unit_cost));
  BACKOFFICE_LOG_INFO("stock received", {StringField("purchase_id", purchase.purchase_id), StringField("batch_id", purchase.batch_id),
                                         IntField("qty", request.qty), MoneyField("total_cost", purchase.total_cost)});
  return {purchase.purchase_id, purchase.batch_id, purchase.total_cost};
}

// ------------------------------------------------------------
// Payments
// ------------------------------------------------------------

CustomerPaymentResult CatalogManager::RecordCustomerPayment(const CustomerPaymentRequest& request) {
  if (request.customer_id.empty()) throw util::InvalidInput("customer id is required");
  if (request.amount <= 0) throw util::InvalidInput("payment amount must be positive");
  if (request.account == model::PaymentMode::kCredit) throw util::InvalidInput("payments must be received in Cash, Bank or Mobile");
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("RecordCustomerPayment");

  auto row = ctx_.store->FindByKey(db::schema::kCustomers, "customer_id", request.customer_id);
  if (!row) throw util::NotFound("customer " + request.customer_id + " not found");
  const auto customer = model::CustomerFromRow(*row);
  if (request.amount > customer.current_balance) {
    throw util::InvalidInput("payment " + util::FormatMoney(request.amount) + " exceeds outstanding balance " + util::FormatMoney(customer.current_balance));
  }

  model::LedgerEntry entry;
  entry.entry_id     = ctx_.sequences->NextId(guard, EntityType::kLedgerEntry);
  entry.date_time    = util::FormatTimestamp(ctx_.now());
  entry.account      = std::string(model::ToString(request.account));
  entry.reference_id = customer.customer_id;
  entry.description  = "Payment from " + customer.name;
  entry.debit        = request.amount;
  entry.created_by   = user;

  const auto balance_after = customer.current_balance - request.amount;
  CommitAndInvalidate(guard, *ctx_.cache, cache::kPaymentInvalidations, [&] {
    db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kCustomers, "customer_id", customer.customer_id,
                                              {{"current_balance", util::FormatMoney(balance_after)}}),
                      "update customer " + customer.customer_id);
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kLedger, {model::ToRow(entry)}), "append payment " + entry.entry_id);
  });

  Audit(user, "Customers", "RecordPayment", customer.customer_id + " amount=" + util::FormatMoney(request.amount),
        "balance=" + util::FormatMoney(customer.current_balance), "balance=" + util::FormatMoney(balance_after));
  BACKOFFICE_LOG_INFO("customer payment recorded", {StringField("customer_id", customer.customer_id), MoneyField("amount", request.amount),
                                                    MoneyField("balance", balance_after)});
  return {entry.entry_id, balance_after};
}

} // namespace backoffice::catalog
