#include "backoffice_server.hpp"

#include "grpc_error.hpp"

namespace backoffice::grpc {

using namespace backoffice::v1;

BackOfficeServer::BackOfficeServer(std::shared_ptr<backoffice::service::SalesService> sales,
                                   std::shared_ptr<backoffice::service::CatalogService> catalog,
                                   std::shared_ptr<backoffice::service::ReportingService> reporting)
    : sales_service_(std::move(sales)), catalog_service_(std::move(catalog)), reporting_service_(std::move(reporting)) {
}

::grpc::Status BackOfficeServer::CreateSale(::grpc::ServerContext*, const CreateSaleRequest* req, CreateSaleResponse* resp) {
  try {
    *resp = sales_service_->CreateSale(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::CancelSale(::grpc::ServerContext*, const CancelSaleRequest* req, CancelSaleResponse* resp) {
  try {
    *resp = sales_service_->CancelSale(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::ProcessReturn(::grpc::ServerContext*, const ProcessReturnRequest* req, ProcessReturnResponse* resp) {
  try {
    *resp = sales_service_->ProcessReturn(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::CreateQuotation(::grpc::ServerContext*, const CreateQuotationRequest* req, CreateQuotationResponse* resp) {
  try {
    *resp = sales_service_->CreateQuotation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::UpdateQuotationStatus(::grpc::ServerContext*, const UpdateQuotationStatusRequest* req, UpdateQuotationStatusResponse*) {
  try {
    sales_service_->UpdateQuotationStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::DeleteQuotation(::grpc::ServerContext*, const DeleteQuotationRequest* req, DeleteQuotationResponse*) {
  try {
    sales_service_->DeleteQuotation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::ConvertQuotation(::grpc::ServerContext*, const ConvertQuotationRequest* req, ConvertQuotationResponse* resp) {
  try {
    *resp = sales_service_->ConvertQuotation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::AddItem(::grpc::ServerContext*, const AddItemRequest* req, AddItemResponse* resp) {
  try {
    *resp = catalog_service_->AddItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::AddCustomer(::grpc::ServerContext*, const AddCustomerRequest* req, AddCustomerResponse* resp) {
  try {
    *resp = catalog_service_->AddCustomer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::AddSupplier(::grpc::ServerContext*, const AddSupplierRequest* req, AddSupplierResponse* resp) {
  try {
    *resp = catalog_service_->AddSupplier(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::ReceiveStock(::grpc::ServerContext*, const ReceiveStockRequest* req, ReceiveStockResponse* resp) {
  try {
    *resp = catalog_service_->ReceiveStock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::RecordPayment(::grpc::ServerContext*, const RecordPaymentRequest* req, RecordPaymentResponse* resp) {
  try {
    *resp = catalog_service_->RecordPayment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::ListSales(::grpc::ServerContext*, const ListSalesRequest* req, ListSalesResponse* resp) {
  try {
    *resp = reporting_service_->ListSales(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::GetSale(::grpc::ServerContext*, const GetSaleRequest* req, GetSaleResponse* resp) {
  try {
    *resp = reporting_service_->GetSale(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::GetInventory(::grpc::ServerContext*, const GetInventoryRequest* req, GetInventoryResponse* resp) {
  try {
    *resp = reporting_service_->GetInventory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::ListCustomers(::grpc::ServerContext*, const ListCustomersRequest* req, ListCustomersResponse* resp) {
  try {
    *resp = reporting_service_->ListCustomers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::ListSuppliers(::grpc::ServerContext*, const ListSuppliersRequest* req, ListSuppliersResponse* resp) {
  try {
    *resp = reporting_service_->ListSuppliers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::ListQuotations(::grpc::ServerContext*, const ListQuotationsRequest* req, ListQuotationsResponse* resp) {
  try {
    *resp = reporting_service_->ListQuotations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::GetDashboard(::grpc::ServerContext*, const GetDashboardRequest* req, GetDashboardResponse* resp) {
  try {
    *resp = reporting_service_->GetDashboard(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BackOfficeServer::RefreshData(::grpc::ServerContext*, const RefreshDataRequest* req, RefreshDataResponse* resp) {
  try {
    *resp = reporting_service_->RefreshData(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace backoffice::grpc
