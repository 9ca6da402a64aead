#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/uuid.hpp"
#include "keyshop/ledger/v1.hpp"
#include "keyshop/ledger/v1/ledger_service.grpc.pb.h"

using namespace keyshop::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  keyshopctl <addr> intent <owner_id> <amount> <days> [currency=RUB] [method]\n"
            << "  keyshopctl <addr> topup-intent <owner_id> <amount> [currency=RUB] [method]\n"
            << "  keyshopctl <addr> status <payment_id>\n"
            << "  keyshopctl <addr> peek <payment_id>\n"
            << "  keyshopctl <addr> latest <owner_id>\n"
            << "  keyshopctl <addr> complete <payment_id>\n"
            << "  keyshopctl <addr> claim <payment_id>\n"
            << "  keyshopctl <addr> fulfill <payment_id>\n"
            << "  keyshopctl <addr> gift <payment_id> <recipient_handle> [recipient_owner_id]\n"
            << "  keyshopctl <addr> report <payment_id>\n"
            << "  keyshopctl <addr> reconcile-owner <owner_id>\n"
            << "  keyshopctl <addr> reconcile-all\n";
}

static std::string Json(const google::protobuf::Message& message) {
  std::string                              out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) return "<unprintable>";
  return out;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

static OrderMetadata Order(int argc, char** argv, int first_optional) {
  OrderMetadata metadata;
  metadata.set_payment_id(keyshop::util::NewPaymentId());
  metadata.set_owner_id(std::stoll(argv[3]));
  metadata.set_amount(argv[4]);
  metadata.set_currency(argc > first_optional ? argv[first_optional] : "RUB");
  if (argc > first_optional + 1) metadata.set_payment_method(argv[first_optional + 1]);
  return metadata;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto ledger_stub    = KeyshopLedgerService::NewStub(channel);
  auto reconcile_stub = KeyshopReconcileService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "intent" || cmd == "topup-intent") {
    const bool top_up = cmd == "topup-intent";
    if (argc < (top_up ? 5 : 6)) {
      Usage();
      return 1;
    }

    CreateOrRefreshIntentRequest req;
    auto*                        metadata = req.mutable_metadata();
    if (top_up) {
      *metadata = Order(argc, argv, 5);
      metadata->mutable_top_up();
    } else {
      *metadata = Order(argc, argv, 6);
      metadata->mutable_new_key()->mutable_plan()->set_duration_days(static_cast<uint32_t>(std::stoul(argv[5])));
    }

    CreateOrRefreshIntentResponse resp;
    auto                          status = ledger_stub->CreateOrRefreshIntent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "payment_id=" << metadata->payment_id() << " accepted=" << (resp.accepted() ? "true" : "false") << "\n";
    return resp.accepted() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetStatusRequest req;
    req.set_payment_id(argv[3]);

    GetStatusResponse resp;
    auto              status = ledger_stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << IntentStatus_Name(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "peek") {
    if (argc < 4) return 1;

    PeekMetadataRequest req;
    req.set_payment_id(argv[3]);

    PeekMetadataResponse resp;
    auto                 status = ledger_stub->PeekMetadata(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "not pending\n";
      return 3;
    }
    std::cout << Json(resp.metadata()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "latest") {
    if (argc < 4) return 1;

    MostRecentPendingRequest req;
    req.set_owner_id(std::stoll(argv[3]));

    MostRecentPendingResponse resp;
    auto                      status = ledger_stub->MostRecentPending(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "no pending intent\n";
      return 3;
    }
    std::cout << Json(resp.metadata()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "complete") {
    if (argc < 4) return 1;

    CompleteIfPendingRequest req;
    req.set_payment_id(argv[3]);

    CompleteIfPendingResponse resp;
    auto                      status = ledger_stub->CompleteIfPending(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.completed()) {
      std::cout << "not completed (already paid or unknown)\n";
      return 3;
    }
    std::cout << Json(resp.metadata()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claim") {
    if (argc < 4) return 1;

    ClaimRequest req;
    req.set_payment_id(argv[3]);

    ClaimResponse resp;
    auto          status = ledger_stub->Claim(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.claimed() ? "claimed" : "already claimed") << "\n";
    return resp.claimed() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "fulfill") {
    if (argc < 4) return 1;

    // completes the intent and runs the returned order right away
    CompleteIfPendingRequest complete_req;
    complete_req.set_payment_id(argv[3]);

    CompleteIfPendingResponse complete_resp;
    auto                      status = ledger_stub->CompleteIfPending(&ctx, complete_req, &complete_resp);
    if (!status.ok()) return Fail(status);
    if (!complete_resp.completed()) {
      std::cout << "not completed (already paid or unknown)\n";
      return 3;
    }

    RunFulfillmentRequest req;
    *req.mutable_metadata() = complete_resp.metadata();

    grpc::ClientContext    run_ctx;
    RunFulfillmentResponse resp;
    status = ledger_stub->RunFulfillment(&run_ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << Json(resp.report()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "gift") {
    if (argc < 5) return 1;

    CompleteGiftRequest req;
    req.set_payment_id(argv[3]);
    req.set_recipient_handle(argv[4]);
    if (argc >= 6) req.set_recipient_owner_id(std::stoll(argv[5]));

    CompleteGiftResponse resp;
    auto                 status = ledger_stub->CompleteGift(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << Json(resp.report()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "report") {
    if (argc < 4) return 1;

    GetFulfillmentReportRequest req;
    req.set_payment_id(argv[3]);

    GetFulfillmentReportResponse resp;
    auto                         status = ledger_stub->GetFulfillmentReport(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << Json(resp.report()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reconcile-owner") {
    if (argc < 4) return 1;

    ReconcileOwnerRequest req;
    req.set_owner_id(std::stoll(argv[3]));

    ReconcileResponse resp;
    auto              status = reconcile_stub->ReconcileOwner(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << Json(resp.report()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reconcile-all") {
    ReconcileAllRequest req;
    ReconcileResponse   resp;
    auto                status = reconcile_stub->ReconcileAll(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << Json(resp.report()) << "\n";
    return 0;
  }

  Usage();
  return 1;
}
