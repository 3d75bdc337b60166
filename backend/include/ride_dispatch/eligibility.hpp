#pragma once

#include "config.hpp"
#include "types.hpp"

namespace ride_dispatch
{

enum class IneligibilityReason
{
    none,
    driver_not_idle,
    recent_ride_with_rider,
    consecutive_cancellations
};

struct EligibilityVerdict
{
    bool eligible{true};
    IneligibilityReason reason{IneligibilityReason::none};
};

// Rules are checked in order: idle status, same-rider cooldown, cancellation
// streak. The first failing rule is the reported reason.
EligibilityVerdict evaluate_eligibility(const Ride &ride, const Driver &driver, TimePoint now, const EligibilityRules &rules);

const char *to_string(IneligibilityReason reason);

} // namespace ride_dispatch
