// timer_service.cpp - One-shot timers for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/timer_service.hpp>
#include <ekrut/common/utils.hpp>

namespace EKrut::Server {
    AsioTimerService::~AsioTimerService() {
        cancelAll();
    }

    TimerHandle AsioTimerService::schedule(std::function<void()> callback, std::chrono::milliseconds delay) {
        std::lock_guard lock(mMutex);

        TimerHandle handle = mNextHandle++;
        if (mStopped) {
            Utils::debug("Timer service is shut down, timer " + std::to_string(handle) + " not armed");
            return handle;
        }

        auto timer = std::make_shared<asio::steady_timer>(mIoContext);
        timer->expires_after(delay);
        timer->async_wait([this, handle, callback = std::move(callback)](const asio::error_code& ec) {
            mOnExpired(handle, ec, callback);
        });

        mTimers.emplace(handle, std::move(timer));
        return handle;
    }

    bool AsioTimerService::cancel(TimerHandle handle) {
        std::lock_guard lock(mMutex);

        auto it = mTimers.find(handle);
        if (it == mTimers.end()) {
            return false; // Already fired or cancelled
        }

        // If the wait already completed the handler is queued with success; erasing the entry suppresses it
        it->second->cancel();
        mTimers.erase(it);
        return true;
    }

    void AsioTimerService::cancelAll() {
        std::lock_guard lock(mMutex);
        for (auto& [handle, timer] : mTimers) {
            timer->cancel();
        }
        mTimers.clear();
    }

    void AsioTimerService::shutdown() {
        {
            std::lock_guard lock(mMutex);
            mStopped = true;
        }
        cancelAll();
    }

    size_t AsioTimerService::pending() const {
        std::lock_guard lock(mMutex);
        return mTimers.size();
    }

    void AsioTimerService::mOnExpired(TimerHandle handle, const asio::error_code& ec, const std::function<void()>& callback) {
        if (ec == asio::error::operation_aborted) {
            return; // Timer was cancelled
        }

        {
            std::lock_guard lock(mMutex);
            auto it = mTimers.find(handle);
            if (it == mTimers.end()) {
                Utils::debug("Timer " + std::to_string(handle) + " expired after cancel, dropping callback");
                return;
            }
            mTimers.erase(it);
        }

        if (ec) {
            Utils::warn("Timer " + std::to_string(handle) + " wait failed: " + ec.message());
            return;
        }

        // Run without holding mMutex so the callback may schedule or cancel timers
        callback();
    }
}
