#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "api/backoffice/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/numeric.hpp"

using namespace backoffice::v1;
using backoffice::util::ParseInt64;
using backoffice::util::ParseMoney;

static void Usage() {
  std::cout << "Usage:\n"
            << "  backofficectl <config.yaml> sale <customer_id> <cash|bank|mobile|credit> <item_id:qty[@price]>... [delivery=X] [discount=X] [notes=N]\n"
            << "  backofficectl <config.yaml> cancel <sale_id> <reason>\n"
            << "  backofficectl <config.yaml> return <sale_id> <item_id:qty>... [reason=R]\n"
            << "  backofficectl <config.yaml> quote <customer_id> <item_id:qty[@price]>... [delivery=X] [discount=X] [valid_days=N] [notes=N]\n"
            << "  backofficectl <config.yaml> quote-status <quotation_id> <draft|pending|accepted|rejected>\n"
            << "  backofficectl <config.yaml> quote-delete <quotation_id>\n"
            << "  backofficectl <config.yaml> convert <quotation_id> <cash|bank|mobile|credit>\n"
            << "  backofficectl <config.yaml> add-item <name> <category> <unit_price> [reorder=N] [opening=qty@cost]\n"
            << "  backofficectl <config.yaml> add-customer <name> [phone=P] [email=E] [credit_limit=X]\n"
            << "  backofficectl <config.yaml> add-supplier <name> [phone=P] [email=E]\n"
            << "  backofficectl <config.yaml> receive <item_id> <qty> <unit_cost> <cash|bank|mobile|credit> [supplier=S]\n"
            << "  backofficectl <config.yaml> payment <customer_id> <amount> <cash|bank|mobile>\n"
            << "  backofficectl <config.yaml> sales [limit]\n"
            << "  backofficectl <config.yaml> show-sale <sale_id>\n"
            << "  backofficectl <config.yaml> inventory|customers|suppliers|quotations|dashboard\n"
            << "  backofficectl <config.yaml> refresh <inventory|customers|suppliers|sales|quotations|dashboard|all>\n"
            << "Every command accepts user=NAME.\n";
}

static std::optional<PaymentMode> ParseMode(const std::string& value) {
  if (value == "cash") return PAYMENT_MODE_CASH;
  if (value == "bank") return PAYMENT_MODE_BANK;
  if (value == "mobile") return PAYMENT_MODE_MOBILE;
  if (value == "credit") return PAYMENT_MODE_CREDIT;
  return std::nullopt;
}

static std::optional<QuotationStatus> ParseQuotationStatus(const std::string& value) {
  if (value == "draft") return QUOTATION_STATUS_DRAFT;
  if (value == "pending") return QUOTATION_STATUS_PENDING;
  if (value == "accepted") return QUOTATION_STATUS_ACCEPTED;
  if (value == "rejected") return QUOTATION_STATUS_REJECTED;
  return std::nullopt;
}

static std::optional<DataDomain> ParseDomain(const std::string& value) {
  if (value == "inventory") return DATA_DOMAIN_INVENTORY;
  if (value == "customers") return DATA_DOMAIN_CUSTOMERS;
  if (value == "suppliers") return DATA_DOMAIN_SUPPLIERS;
  if (value == "sales") return DATA_DOMAIN_SALES;
  if (value == "quotations") return DATA_DOMAIN_QUOTATIONS;
  if (value == "dashboard") return DATA_DOMAIN_DASHBOARD;
  if (value == "all") return DATA_DOMAIN_ALL;
  return std::nullopt;
}

// Splits trailing key=value options from positional arguments.
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;

  std::string Option(const std::string& key, const std::string& fallback = "") const {
    const auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
  }
};

static Args SplitArgs(int argc, char** argv, int first) {
  Args args;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq != std::string::npos && eq > 0 && arg.find(':') == std::string::npos) {
      args.options[arg.substr(0, eq)] = arg.substr(eq + 1);
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

// "ITEM0001:3" or "ITEM0001:3@12.50"
static LineItem ParseLine(const std::string& spec) {
  const auto colon = spec.find(':');
  if (colon == std::string::npos || colon == 0) {
    throw backoffice::util::InvalidInput("expected item_id:qty, got '" + spec + "'");
  }
  LineItem   line;
  const auto at = spec.find('@', colon);
  line.set_item_id(spec.substr(0, colon));
  line.set_qty(ParseInt64(spec.substr(colon + 1, at == std::string::npos ? std::string::npos : at - colon - 1)));
  if (at != std::string::npos) {
    line.set_unit_price_cents(ParseMoney(spec.substr(at + 1)));
  }
  return line;
}

static int Print(const google::protobuf::Message& message) {
  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  const auto status      = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.ToString() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

static int Run(backoffice::factory::Application& app, const std::string& cmd, const Args& args) {
  const auto& pos  = args.positional;
  const auto  user = args.Option("user");

  // ------------------------------------------------------------

  if (cmd == "sale") {
    if (pos.size() < 3) return 1;
    const auto mode = ParseMode(pos[1]);
    if (!mode) {
      std::cerr << "unsupported payment mode: " << pos[1] << "\n";
      return 1;
    }

    CreateSaleRequest req;
    req.set_customer_id(pos[0]);
    req.set_payment_mode(*mode);
    for (std::size_t i = 2; i < pos.size(); ++i) {
      *req.add_lines() = ParseLine(pos[i]);
    }
    req.set_delivery_charge_cents(ParseMoney(args.Option("delivery", "0")));
    req.set_discount_cents(ParseMoney(args.Option("discount", "0")));
    req.set_notes(args.Option("notes"));
    req.set_user(user);
    return Print(app.sales_service->CreateSale(req));
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (pos.size() < 2) return 1;
    CancelSaleRequest req;
    req.set_transaction_id(pos[0]);
    req.set_reason(pos[1]);
    req.set_user(user);
    return Print(app.sales_service->CancelSale(req));
  }

  // ------------------------------------------------------------

  if (cmd == "return") {
    if (pos.size() < 2) return 1;
    ProcessReturnRequest req;
    req.set_transaction_id(pos[0]);
    for (std::size_t i = 1; i < pos.size(); ++i) {
      const auto line = ParseLine(pos[i]);
      auto*      ret  = req.add_lines();
      ret->set_item_id(line.item_id());
      ret->set_qty(line.qty());
    }
    req.set_reason(args.Option("reason"));
    req.set_user(user);
    return Print(app.sales_service->ProcessReturn(req));
  }

  // ------------------------------------------------------------

  if (cmd == "quote") {
    if (pos.size() < 2) return 1;
    CreateQuotationRequest req;
    req.set_customer_id(pos[0]);
    for (std::size_t i = 1; i < pos.size(); ++i) {
      *req.add_lines() = ParseLine(pos[i]);
    }
    req.set_delivery_charge_cents(ParseMoney(args.Option("delivery", "0")));
    req.set_discount_cents(ParseMoney(args.Option("discount", "0")));
    if (const auto days = args.Option("valid_days"); !days.empty()) {
      req.set_valid_days(static_cast<std::uint32_t>(ParseInt64(days)));
    }
    req.set_notes(args.Option("notes"));
    req.set_user(user);
    return Print(app.sales_service->CreateQuotation(req));
  }

  if (cmd == "quote-status") {
    if (pos.size() < 2) return 1;
    const auto status = ParseQuotationStatus(pos[1]);
    if (!status) {
      std::cerr << "unsupported quotation status: " << pos[1] << "\n";
      return 1;
    }
    UpdateQuotationStatusRequest req;
    req.set_quotation_id(pos[0]);
    req.set_status(*status);
    req.set_user(user);
    app.sales_service->UpdateQuotationStatus(req);
    std::cout << "updated\n";
    return 0;
  }

  if (cmd == "quote-delete") {
    if (pos.empty()) return 1;
    DeleteQuotationRequest req;
    req.set_quotation_id(pos[0]);
    req.set_user(user);
    app.sales_service->DeleteQuotation(req);
    std::cout << "deleted\n";
    return 0;
  }

  if (cmd == "convert") {
    if (pos.size() < 2) return 1;
    const auto mode = ParseMode(pos[1]);
    if (!mode) {
      std::cerr << "unsupported payment mode: " << pos[1] << "\n";
      return 1;
    }
    ConvertQuotationRequest req;
    req.set_quotation_id(pos[0]);
    req.set_payment_mode(*mode);
    req.set_user(user);
    return Print(app.sales_service->ConvertQuotation(req));
  }

  // ------------------------------------------------------------

  if (cmd == "add-item") {
    if (pos.size() < 3) return 1;
    AddItemRequest req;
    req.set_name(pos[0]);
    req.set_category(pos[1]);
    req.set_unit_price_cents(ParseMoney(pos[2]));
    req.set_reorder_level(ParseInt64(args.Option("reorder", "0")));
    if (const auto opening = args.Option("opening"); !opening.empty()) {
      const auto at = opening.find('@');
      if (at == std::string::npos) {
        std::cerr << "opening stock must be qty@cost\n";
        return 1;
      }
      req.set_opening_qty(ParseInt64(opening.substr(0, at)));
      req.set_opening_cost_cents(ParseMoney(opening.substr(at + 1)));
    }
    req.set_user(user);
    return Print(app.catalog_service->AddItem(req));
  }

  if (cmd == "add-customer") {
    if (pos.empty()) return 1;
    AddCustomerRequest req;
    req.set_name(pos[0]);
    req.set_phone(args.Option("phone"));
    req.set_email(args.Option("email"));
    req.set_credit_limit_cents(ParseMoney(args.Option("credit_limit", "0")));
    req.set_user(user);
    return Print(app.catalog_service->AddCustomer(req));
  }

  if (cmd == "add-supplier") {
    if (pos.empty()) return 1;
    AddSupplierRequest req;
    req.set_name(pos[0]);
    req.set_phone(args.Option("phone"));
    req.set_email(args.Option("email"));
    req.set_user(user);
    return Print(app.catalog_service->AddSupplier(req));
  }

  if (cmd == "receive") {
    if (pos.size() < 4) return 1;
    const auto mode = ParseMode(pos[3]);
    if (!mode) {
      std::cerr << "unsupported payment mode: " << pos[3] << "\n";
      return 1;
    }
    ReceiveStockRequest req;
    req.set_item_id(pos[0]);
    req.set_qty(ParseInt64(pos[1]));
    req.set_unit_cost_cents(ParseMoney(pos[2]));
    req.set_payment_mode(*mode);
    req.set_supplier_id(args.Option("supplier"));
    req.set_user(user);
    return Print(app.catalog_service->ReceiveStock(req));
  }

  if (cmd == "payment") {
    if (pos.size() < 3) return 1;
    const auto mode = ParseMode(pos[2]);
    if (!mode) {
      std::cerr << "unsupported account: " << pos[2] << "\n";
      return 1;
    }
    RecordPaymentRequest req;
    req.set_customer_id(pos[0]);
    req.set_amount_cents(ParseMoney(pos[1]));
    req.set_account(*mode);
    req.set_user(user);
    return Print(app.catalog_service->RecordPayment(req));
  }

  // ------------------------------------------------------------

  if (cmd == "sales") {
    ListSalesRequest req;
    if (!pos.empty()) req.set_limit(static_cast<std::uint32_t>(ParseInt64(pos[0])));
    return Print(app.reporting_service->ListSales(req));
  }

  if (cmd == "show-sale") {
    if (pos.empty()) return 1;
    GetSaleRequest req;
    req.set_transaction_id(pos[0]);
    return Print(app.reporting_service->GetSale(req));
  }

  if (cmd == "inventory") return Print(app.reporting_service->GetInventory({}));
  if (cmd == "customers") return Print(app.reporting_service->ListCustomers({}));
  if (cmd == "suppliers") return Print(app.reporting_service->ListSuppliers({}));
  if (cmd == "quotations") return Print(app.reporting_service->ListQuotations({}));
  if (cmd == "dashboard") return Print(app.reporting_service->GetDashboard({}));

  if (cmd == "refresh") {
    if (pos.empty()) return 1;
    const auto domain = ParseDomain(pos[0]);
    if (!domain) {
      std::cerr << "unsupported domain: " << pos[0] << "\n";
      return 1;
    }
    RefreshDataRequest req;
    req.set_domain(*domain);
    return Print(app.reporting_service->RefreshData(req));
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = backoffice::config::ConfigLoader::LoadFromYaml(config_path);
    backoffice::observability::InitializeLogging(config);

    auto      app  = backoffice::factory::Build(config);
    const int code = Run(app, cmd, SplitArgs(argc, argv, 3));
    if (code == 1) {
      Usage();
    }
    backoffice::observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    backoffice::observability::ShutdownLogging();
    return 2;
  }
}
