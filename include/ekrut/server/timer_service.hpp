// timer_service.hpp - One-shot timers for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <asio.hpp>

namespace EKrut::Server {
    using TimerHandle = uint64_t;
    using Clock = std::chrono::steady_clock;

    // Schedules one-shot callbacks. Callbacks run on the service's own thread(s), never inside schedule() or cancel().
    class TimerService {
        public:
            virtual ~TimerService() = default;

            // Run callback once after delay. The returned handle is never 0.
            virtual TimerHandle schedule(std::function<void()> callback, std::chrono::milliseconds delay) = 0;

            // Cancel a pending timer. Returns false if it already fired, was already cancelled or is unknown.
            virtual bool cancel(TimerHandle handle) = 0;

            // Current time on the clock timers are measured against
            virtual Clock::time_point now() const = 0;
    };

    // TimerService backed by asio steady timers on an io_context. Must outlive the io_context's handlers.
    class AsioTimerService : public TimerService {
        public:
            explicit AsioTimerService(asio::io_context& ioContext) : mIoContext(ioContext) {}
            ~AsioTimerService() override;

            AsioTimerService(const AsioTimerService&) = delete;
            AsioTimerService& operator=(const AsioTimerService&) = delete;

            TimerHandle schedule(std::function<void()> callback, std::chrono::milliseconds delay) override;
            bool cancel(TimerHandle handle) override;
            Clock::time_point now() const override { return Clock::now(); }

            // Cancel every pending timer
            void cancelAll();
            // Cancel every pending timer and arm no new ones. Later schedule() calls return a handle that never fires.
            void shutdown();
            // Number of timers that have neither fired nor been cancelled
            size_t pending() const;

        private:
            void mOnExpired(TimerHandle handle, const asio::error_code& ec, const std::function<void()>& callback);

            asio::io_context& mIoContext;
            mutable std::mutex mMutex;
            std::unordered_map<TimerHandle, std::shared_ptr<asio::steady_timer>> mTimers;
            TimerHandle mNextHandle = 1;
            bool mStopped = false;
    };
}
