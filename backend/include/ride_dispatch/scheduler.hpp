#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "allocation.hpp"
#include "config.hpp"
#include "entity_store.hpp"

namespace ride_dispatch
{

struct DispatchStats
{
    std::size_t passes_run{0};
    std::size_t passes_skipped{0};
    std::size_t pass_failures{0};
    std::size_t rides_assigned{0};
    std::size_t rides_exhausted{0};
    std::size_t rides_aborted{0};
    std::size_t ride_failures{0};
    long long last_pass_ms{0};
};

// Runs a dispatch pass on a fixed cadence in a background thread. Passes never
// overlap: a tick or manual trigger that arrives while a pass is running is skipped.
class DispatchScheduler
{
public:
    using PassFn = std::function<DispatchPassReport()>;

    DispatchScheduler(std::chrono::milliseconds interval, PassFn pass);
    DispatchScheduler(EntityStore &store, const DispatchConfig &dispatch);
    ~DispatchScheduler();

    DispatchScheduler(const DispatchScheduler &) = delete;
    DispatchScheduler &operator=(const DispatchScheduler &) = delete;

    void start();
    void stop();
    bool running() const;

    // Runs one pass on the calling thread; std::nullopt if skipped or the pass threw.
    std::optional<DispatchPassReport> run_once();

    DispatchStats stats() const;

private:
    void loop();

    std::chrono::milliseconds interval_;
    PassFn pass_;

    std::mutex pass_mutex_;
    mutable std::mutex state_mutex_;
    std::condition_variable wake_;
    bool stop_requested_{false};
    bool running_{false};
    std::thread worker_;
    DispatchStats stats_;
};

} // namespace ride_dispatch
