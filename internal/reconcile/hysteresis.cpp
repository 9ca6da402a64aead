#include "hysteresis.hpp"

namespace keyshop::reconcile::hysteresis {

const char* ToString(Decision decision) {
  switch (decision) {
    case Decision::Keep:
      return "keep";
    case Decision::ClearMissing:
      return "clear_missing";
    case Decision::MarkMissing:
      return "mark_missing";
    case Decision::DeleteCandidate:
      return "delete_candidate";
  }
  return "unknown";
}

Decision Decide(provisioning::Presence observed, std::optional<int64_t> missing_since_ms, int64_t now_ms, int64_t grace_ms) {
  switch (observed) {
    case provisioning::Presence::Present:
      return missing_since_ms ? Decision::ClearMissing : Decision::Keep;
    case provisioning::Presence::Unknown:
      return Decision::Keep;
    case provisioning::Presence::Absent:
      if (!missing_since_ms) return Decision::MarkMissing;
      return now_ms - *missing_since_ms > grace_ms ? Decision::DeleteCandidate : Decision::Keep;
  }
  return Decision::Keep;
}

} // namespace keyshop::reconcile::hysteresis
