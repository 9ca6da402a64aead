#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace keyshop::util {

struct HttpResponse {
  long        status = 0;
  std::string body;
};

// Transport failure: nothing usable came back.
class HttpError : public std::runtime_error {
 public:
  HttpError(const std::string& msg, bool timed_out) : std::runtime_error(msg), timed_out_(timed_out) {
  }

  bool timed_out() const {
    return timed_out_;
  }

 private:
  bool timed_out_;
};

/*
  Minimal blocking HTTP seam used by the outbound adapters (panel,
  Telegram). Any status code is returned; only transport failures throw.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Perform(const std::string& method, const std::string& url, const std::vector<std::string>& headers, const std::string& body,
                               std::chrono::milliseconds timeout) = 0;
};

// libcurl implementation. One easy handle per request, so it is safe to
// share across threads.
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();

  HttpResponse Perform(const std::string& method, const std::string& url, const std::vector<std::string>& headers, const std::string& body,
                       std::chrono::milliseconds timeout) override;
};

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string UrlEncode(const std::string& value);

} // namespace keyshop::util
