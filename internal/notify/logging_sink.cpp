#include "logging_sink.hpp"

#include "internal/observability/logging.hpp"

namespace keyshop::notify {

bool LoggingNotificationSink::NotifyPayer(int64_t chat_id, const std::string& message) {
  KEYSHOP_LOG_INFO("payer notification", {observability::IntField("chat_id", chat_id), observability::StringField("message", message)});
  return true;
}

bool LoggingNotificationSink::NotifyOperators(const std::string& message) {
  KEYSHOP_LOG_INFO("operator notification", {observability::StringField("message", message)});
  return true;
}

bool LoggingNotificationSink::DeleteMessage(int64_t chat_id, int64_t message_id) {
  KEYSHOP_LOG_DEBUG("message delete", {observability::IntField("chat_id", chat_id), observability::IntField("message_id", message_id)});
  return true;
}

} // namespace keyshop::notify
