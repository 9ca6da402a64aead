#include "relay_verifier.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>

#include "internal/util/money.hpp"

namespace keyshop::payments {

namespace {

constexpr const char* kBearer = "Bearer ";

std::string Field(const google::protobuf::Struct& body, const std::string& name) {
  auto it = body.fields().find(name);
  if (it == body.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return {};
  return it->second.string_value();
}

} // namespace

RelayTokenVerifier::RelayTokenVerifier(std::string token) : token_(std::move(token)) {
}

std::optional<VerifiedPayment> RelayTokenVerifier::Verify(const RawNotification& notification) const {
  if (token_.empty()) return std::nullopt;

  auto auth = notification.headers.find("authorization");
  if (auth == notification.headers.end() || auth->second.rfind(kBearer, 0) != 0) return std::nullopt;
  if (!ConstantTimeEquals(auth->second.substr(std::char_traits<char>::length(kBearer)), token_)) return std::nullopt;

  google::protobuf::Struct                 body;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(notification.body, &body, options).ok()) return std::nullopt;

  VerifiedPayment payment;
  payment.provider_payment_id = Field(body, "provider_payment_id");
  payment.internal_payment_id = Field(body, "payment_id");
  payment.currency            = Field(body, "currency");
  std::transform(payment.currency.begin(), payment.currency.end(), payment.currency.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  auto amount = util::ParseMinorUnits(Field(body, "amount"));
  if (payment.internal_payment_id.empty() || !amount || *amount <= 0) return std::nullopt;
  payment.amount_minor = *amount;
  return payment;
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
  unsigned char diff = a.size() == b.size() ? 0 : 1;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i % (b.empty() ? 1 : b.size())]);
  }
  return diff == 0 && !b.empty();
}

} // namespace keyshop::payments
