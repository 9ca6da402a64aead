#pragma once

#include "internal/notify/notification_sink.hpp"

namespace keyshop::notify {

// Used when no bot token is configured.
class LoggingNotificationSink final : public NotificationSink {
 public:
  bool NotifyPayer(int64_t chat_id, const std::string& message) override;
  bool NotifyOperators(const std::string& message) override;
  bool DeleteMessage(int64_t chat_id, int64_t message_id) override;
};

} // namespace keyshop::notify
