#include "ride_dispatch/driver_history.hpp"

#include <algorithm>
#include <cstddef>

namespace ride_dispatch
{

DriverHistory::DriverHistory(std::size_t capacity, std::chrono::minutes retention)
    : capacity_(std::max<std::size_t>(capacity, 1)), retention_(retention)
{
}

void DriverHistory::push(const OutcomeRecord &record)
{
    outcomes_.push_back(record);
    while (outcomes_.size() > capacity_)
    {
        outcomes_.pop_front();
    }
}

void DriverHistory::record_completion(long ride_id, long rider_id, TimePoint at)
{
    push({ride_id, RideOutcome::completed, at});

    const TimePoint horizon = at - retention_;
    for (auto it = last_completed_with_rider_.begin(); it != last_completed_with_rider_.end();)
    {
        if (it->second <= horizon)
        {
            it = last_completed_with_rider_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    auto &latest = last_completed_with_rider_[rider_id];
    latest = std::max(latest, at);
}

void DriverHistory::record_cancellation(long ride_id, TimePoint at)
{
    push({ride_id, RideOutcome::cancelled, at});
}

bool DriverHistory::ends_with_cancellations(std::size_t count) const
{
    if (count == 0 || outcomes_.size() < count)
    {
        return false;
    }

    return std::all_of(outcomes_.end() - static_cast<std::ptrdiff_t>(count), outcomes_.end(),
                       [](const OutcomeRecord &record)
                       { return record.outcome == RideOutcome::cancelled; });
}

std::optional<TimePoint> DriverHistory::last_completion_with(long rider_id) const
{
    const auto it = last_completed_with_rider_.find(rider_id);
    if (it == last_completed_with_rider_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace ride_dispatch
