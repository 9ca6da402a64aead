#include "internal/provisioning/error_classifier.hpp"

#include <cassert>
#include <iostream>

namespace {

using keyshop::provisioning::ClassifyError;

void TestKnownFailures() {
  assert(ClassifyError("User with this email already exists") == keyshop::provisioning::kIdentityTaken);
  assert(ClassifyError("panel returned 409: conflict") == keyshop::provisioning::kIdentityTaken);
  assert(ClassifyError("Duplicate key value") == keyshop::provisioning::kIdentityTaken);
  assert(ClassifyError("host not found: fi-9") == keyshop::provisioning::kHostNotFound);
  assert(ClassifyError("Could not resolve host: panel.example") == keyshop::provisioning::kHostNotFound);
  assert(ClassifyError("Operation timed out after 15000 milliseconds") == keyshop::provisioning::kTimeout);
  assert(ClassifyError("gateway TIMEOUT") == keyshop::provisioning::kTimeout);
  assert(ClassifyError("panel returned 401: Unauthorized") == keyshop::provisioning::kUnauthorized);
  assert(ClassifyError("403 Forbidden") == keyshop::provisioning::kUnauthorized);
}

void TestPrecedence() {
  // a conflict that mentions the token is still a conflict
  assert(ClassifyError("409 unauthorized duplicate") == keyshop::provisioning::kIdentityTaken);
  assert(ClassifyError("timeout reaching host not found") == keyshop::provisioning::kHostNotFound);
}

void TestEverythingElseIsUpstream() {
  assert(ClassifyError("") == keyshop::provisioning::kUpstreamError);
  assert(ClassifyError("panel returned 500: internal error") == keyshop::provisioning::kUpstreamError);
  assert(ClassifyError("panel response carried no user uuid") == keyshop::provisioning::kUpstreamError);
}

} // namespace

int main() {
  TestKnownFailures();
  TestPrecedence();
  TestEverythingElseIsUpstream();

  std::cout << "keyshop_unit_error_classifier: pass\n";
  return 0;
}
