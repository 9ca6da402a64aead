#pragma once

#include <cstdint>
#include <string>

namespace keyshop::notify {

/*
  Outbound messages to payers and operators.

  Implementations never throw; delivery failures are logged and reported
  through the return value so callers can record them.
*/
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual bool NotifyPayer(int64_t chat_id, const std::string& message) = 0;

  virtual bool NotifyOperators(const std::string& message) = 0;

  virtual bool DeleteMessage(int64_t chat_id, int64_t message_id) = 0;
};

} // namespace keyshop::notify
