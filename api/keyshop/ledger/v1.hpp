#pragma once

// Message types of the keyshop.ledger.v1 package. Service stubs live in
// keyshop/ledger/v1/ledger_service.grpc.pb.h and are only generated when
// the gRPC plugin is available.

#include "keyshop/ledger/v1/order.pb.h"
#include "keyshop/ledger/v1/ledger_service.pb.h"
