#include "ride_dispatch/scheduler.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ride_dispatch
{

DispatchScheduler::DispatchScheduler(std::chrono::milliseconds interval, PassFn pass)
    : interval_(interval), pass_(std::move(pass))
{
    if (interval_.count() <= 0)
    {
        throw std::invalid_argument("Dispatch interval must be positive.");
    }
    if (!pass_)
    {
        throw std::invalid_argument("Dispatch scheduler requires a pass function.");
    }
}

DispatchScheduler::DispatchScheduler(EntityStore &store, const DispatchConfig &dispatch)
    : DispatchScheduler(std::chrono::duration_cast<std::chrono::milliseconds>(dispatch.interval),
                        [&store, dispatch]()
                        { return run_dispatch_pass(store, dispatch); })
{
}

DispatchScheduler::~DispatchScheduler()
{
    stop();
}

void DispatchScheduler::start()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_)
    {
        return;
    }

    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread(&DispatchScheduler::loop, this);
    std::cout << "Dispatch scheduler started (interval " << interval_.count() << " ms)." << std::endl;
}

void DispatchScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_)
        {
            return;
        }
        stop_requested_ = true;
    }
    wake_.notify_all();

    if (worker_.joinable())
    {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = false;
    std::cout << "Dispatch scheduler stopped." << std::endl;
}

bool DispatchScheduler::running() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

std::optional<DispatchPassReport> DispatchScheduler::run_once()
{
    std::unique_lock<std::mutex> pass_lock(pass_mutex_, std::try_to_lock);
    if (!pass_lock.owns_lock())
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.passes_skipped++;
        std::cout << "Dispatch pass still running, skipping this trigger." << std::endl;
        return std::nullopt;
    }

    try
    {
        DispatchPassReport report = pass_();

        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.passes_run++;
        stats_.rides_assigned += report.assigned;
        stats_.rides_exhausted += report.exhausted;
        stats_.rides_aborted += report.aborted;
        stats_.ride_failures += report.failed;
        stats_.last_pass_ms = report.elapsed_ms;
        return report;
    }
    catch (const std::exception &ex)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.pass_failures++;
        std::cerr << "Dispatch pass failed: " << ex.what() << std::endl;
        return std::nullopt;
    }
}

DispatchStats DispatchScheduler::stats() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_;
}

void DispatchScheduler::loop()
{
    auto next_tick = std::chrono::steady_clock::now() + interval_;

    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            if (wake_.wait_until(lock, next_tick, [this]
                                 { return stop_requested_; }))
            {
                return;
            }
        }

        run_once();

        // Ticks missed while the pass ran are dropped rather than queued.
        next_tick += interval_;
        const auto now = std::chrono::steady_clock::now();
        while (next_tick <= now)
        {
            next_tick += interval_;
            std::lock_guard<std::mutex> lock(state_mutex_);
            stats_.passes_skipped++;
        }
    }
}

} // namespace ride_dispatch
