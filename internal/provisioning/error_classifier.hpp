#pragma once

#include <string>
#include <string_view>

namespace keyshop::provisioning {

// Short failure codes shown to payers and operators.
inline constexpr const char* kIdentityTaken = "identity_taken";
inline constexpr const char* kHostNotFound  = "host_not_found";
inline constexpr const char* kTimeout       = "timeout";
inline constexpr const char* kUnauthorized  = "unauthorized";
inline constexpr const char* kUpstreamError = "upstream_error";

// Maps raw upstream error text to one of the codes above.
std::string ClassifyError(std::string_view upstream);

} // namespace keyshop::provisioning
