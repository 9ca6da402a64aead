#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/notify/notification_sink.hpp"
#include "internal/util/http_client.hpp"

namespace keyshop::notify {

/*
  Telegram Bot API sink. Operator messages go to every configured
  operator chat; the call succeeds when at least one delivery did.
*/
class TelegramNotificationSink final : public NotificationSink {
 public:
  TelegramNotificationSink(const keyshop::runtime::config::TelegramConfig& config, std::shared_ptr<util::HttpClient> http);

  bool NotifyPayer(int64_t chat_id, const std::string& message) override;
  bool NotifyOperators(const std::string& message) override;
  bool DeleteMessage(int64_t chat_id, int64_t message_id) override;

 private:
  bool Call(const std::string& method, const std::string& body);

  std::string                       endpoint_;
  std::vector<int64_t>              operator_chats_;
  std::chrono::milliseconds         timeout_;
  std::shared_ptr<util::HttpClient> http_;
};

} // namespace keyshop::notify
