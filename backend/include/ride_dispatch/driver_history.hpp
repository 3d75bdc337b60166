#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <unordered_map>

#include "clock.hpp"

namespace ride_dispatch
{

enum class RideOutcome
{
    completed,
    cancelled
};

struct OutcomeRecord
{
    long ride_id{};
    RideOutcome outcome{RideOutcome::completed};
    TimePoint at{};
};

// Bounded ring of a driver's most recent ride outcomes, plus the last completion
// time per rider for the same-rider cooldown. Cooldown entries older than the
// retention window are dropped whenever a completion is recorded.
class DriverHistory
{
public:
    DriverHistory() = default;
    DriverHistory(std::size_t capacity, std::chrono::minutes retention);

    void record_completion(long ride_id, long rider_id, TimePoint at);
    void record_cancellation(long ride_id, TimePoint at);

    // True when the newest `count` outcomes exist and are all cancellations.
    bool ends_with_cancellations(std::size_t count) const;
    std::optional<TimePoint> last_completion_with(long rider_id) const;

    const std::deque<OutcomeRecord> &outcomes() const { return outcomes_; }
    std::size_t tracked_riders() const { return last_completed_with_rider_.size(); }

private:
    void push(const OutcomeRecord &record);

    std::size_t capacity_{8};
    std::chrono::minutes retention_{30};
    std::deque<OutcomeRecord> outcomes_;
    std::unordered_map<long, TimePoint> last_completed_with_rider_;
};

} // namespace ride_dispatch
