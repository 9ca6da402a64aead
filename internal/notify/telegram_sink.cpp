#include "telegram_sink.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"

namespace keyshop::notify {

using google::protobuf::Struct;

namespace {

std::string ToJson(const Struct& message) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json).ok()) return {};
  return json;
}

} // namespace

TelegramNotificationSink::TelegramNotificationSink(const keyshop::runtime::config::TelegramConfig& config, std::shared_ptr<util::HttpClient> http)
    : endpoint_(config.api_base_url() + "/bot" + config.bot_token() + "/"),
      operator_chats_(config.operator_chat_ids().begin(), config.operator_chat_ids().end()),
      timeout_(config.timeout_ms()),
      http_(std::move(http)) {
}

bool TelegramNotificationSink::Call(const std::string& method, const std::string& body) {
  try {
    auto resp = http_->Perform("POST", endpoint_ + method, {"Content-Type: application/json"}, body, timeout_);
    if (resp.status == 200) return true;
    KEYSHOP_LOG_WARN("telegram call rejected", {observability::StringField("method", method), observability::IntField("status", resp.status),
                                                observability::StringField("body", resp.body)});
  } catch (const util::HttpError& e) {
    KEYSHOP_LOG_WARN("telegram call failed", {observability::StringField("method", method), observability::StringField("error", e.what())});
  }
  return false;
}

bool TelegramNotificationSink::NotifyPayer(int64_t chat_id, const std::string& message) {
  Struct body;
  auto&  fields = *body.mutable_fields();
  // Bot API accepts chat ids as strings
  fields["chat_id"].set_string_value(std::to_string(chat_id));
  fields["text"].set_string_value(message);
  return Call("sendMessage", ToJson(body));
}

bool TelegramNotificationSink::NotifyOperators(const std::string& message) {
  bool delivered = false;
  for (int64_t chat_id : operator_chats_) {
    delivered = NotifyPayer(chat_id, message) || delivered;
  }
  return delivered;
}

bool TelegramNotificationSink::DeleteMessage(int64_t chat_id, int64_t message_id) {
  Struct body;
  auto&  fields = *body.mutable_fields();
  fields["chat_id"].set_string_value(std::to_string(chat_id));
  fields["message_id"].set_number_value(static_cast<double>(message_id));
  return Call("deleteMessage", ToJson(body));
}

} // namespace keyshop::notify
