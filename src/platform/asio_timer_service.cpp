/*
 * gcrdl/src/platform/asio_timer_service.cpp
 *
 * Recurring named timers on a private io_context. Each schedule spawns a coroutine loop
 * around one steady_timer; cancel flags the slot and aborts the pending wait.
 */

#include <gcrdl/platform/timer_service.h>

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <map>
#include <mutex>
#include <thread>

namespace gcrdl::platform {

namespace {

struct TimerSlot {
    explicit TimerSlot(boost::asio::io_context& io) : timer(io) {}

    boost::asio::steady_timer timer;
    std::atomic<bool> cancelled{false};
};

class AsioTimerService final : public ITimerService {
public:
    AsioTimerService() : work_(boost::asio::make_work_guard(io_)), thread_([this] { io_.run(); }) {}

    ~AsioTimerService() override {
        {
            std::lock_guard lk(mutex_);
            for (auto& [name, slot] : slots_) {
                slot->cancelled.store(true, std::memory_order_release);
            }
            slots_.clear();
        }
        work_.reset();
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void scheduleRecurring(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> callback) override {
        auto slot = std::make_shared<TimerSlot>(io_);
        {
            std::lock_guard lk(mutex_);
            if (auto it = slots_.find(name); it != slots_.end()) {
                stopSlot(it->second);
            }
            slots_[name] = slot;
        }
        spdlog::debug("TimerService: '{}' every {}ms", name, interval.count());
        boost::asio::co_spawn(io_, runLoop(slot, std::move(name), interval, std::move(callback)),
                              boost::asio::detached);
    }

    void cancel(std::string_view name) override {
        std::lock_guard lk(mutex_);
        auto it = slots_.find(std::string(name));
        if (it == slots_.end()) {
            return;
        }
        stopSlot(it->second);
        slots_.erase(it);
    }

    bool isScheduled(std::string_view name) const override {
        std::lock_guard lk(mutex_);
        return slots_.count(std::string(name)) != 0;
    }

private:
    static boost::asio::awaitable<void> runLoop(std::shared_ptr<TimerSlot> slot, std::string name,
                                                std::chrono::milliseconds interval,
                                                std::function<void()> callback) {
        while (!slot->cancelled.load(std::memory_order_acquire)) {
            slot->timer.expires_after(interval);
            try {
                co_await slot->timer.async_wait(boost::asio::use_awaitable);
            } catch (const boost::system::system_error& e) {
                if (e.code() == boost::asio::error::operation_aborted) {
                    co_return;
                }
                throw;
            }
            if (slot->cancelled.load(std::memory_order_acquire)) {
                co_return;
            }
            try {
                callback();
            } catch (const std::exception& e) {
                spdlog::error("TimerService: '{}' callback failed: {}", name, e.what());
            }
        }
    }

    void stopSlot(const std::shared_ptr<TimerSlot>& slot) {
        slot->cancelled.store(true, std::memory_order_release);
        boost::asio::post(io_, [slot] { slot->timer.cancel(); });
    }

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TimerSlot>> slots_;
};

} // namespace

std::unique_ptr<ITimerService> makeAsioTimerService() {
    return std::make_unique<AsioTimerService>();
}

} // namespace gcrdl::platform
