#include "error_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace keyshop::provisioning {

namespace {

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const char* needle) { return haystack.find(needle) != std::string::npos; });
}

} // namespace

std::string ClassifyError(std::string_view upstream) {
  std::string text(upstream);
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // order matters: "user already exists" responses often carry a 400/409
  if (ContainsAny(text, {"already exists", "already taken", "already in use", "duplicate", "409"})) return kIdentityTaken;
  if (ContainsAny(text, {"host not found", "unknown host", "no such host", "could not resolve"})) return kHostNotFound;
  if (ContainsAny(text, {"timed out", "timeout"})) return kTimeout;
  if (ContainsAny(text, {"unauthorized", "forbidden", "401", "403"})) return kUnauthorized;
  return kUpstreamError;
}

} // namespace keyshop::provisioning
