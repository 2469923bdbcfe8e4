#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace gcrdl::platform {

/**
 * Named recurring timers. Scheduling a name that already exists replaces it and restarts
 * its period. Callbacks run on the service's own thread.
 */
class ITimerService {
public:
    virtual ~ITimerService() = default;

    virtual void scheduleRecurring(std::string name, std::chrono::milliseconds interval,
                                   std::function<void()> callback) = 0;
    virtual void cancel(std::string_view name) = 0;
    virtual bool isScheduled(std::string_view name) const = 0;
};

// boost::asio io_context + steady_timer on a dedicated thread. Stops on destruction.
std::unique_ptr<ITimerService> makeAsioTimerService();

} // namespace gcrdl::platform
