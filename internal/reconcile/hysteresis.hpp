#pragma once

#include <cstdint>
#include <optional>

#include "internal/provisioning/provisioning_client.hpp"

namespace keyshop::reconcile::hysteresis {

/*
  Debounced soft delete of one credential.

    present          -> clear missing_since
    absent, fresh    -> start the grace window
    absent, stale    -> delete candidate (confirmed by a second check)
    unknown          -> nothing; an ambiguous answer never moves toward deletion
*/
enum class Decision { Keep, ClearMissing, MarkMissing, DeleteCandidate };

const char* ToString(Decision decision);

Decision Decide(provisioning::Presence observed, std::optional<int64_t> missing_since_ms, int64_t now_ms, int64_t grace_ms);

} // namespace keyshop::reconcile::hysteresis
