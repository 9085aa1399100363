#pragma once
#include <chrono>
#include <memory>
#include <thread>

namespace Bulwark {
namespace Core {

// Time source shared by the throttling and health-tracking components.
// Tests substitute a manual clock that advances when asked to sleep.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration   = std::chrono::duration<double>;

    virtual ~Clock() = default;

    virtual time_point now() const                 = 0;
    virtual void       sleep_for(duration seconds) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    void sleep_for(duration seconds) override {
        if (seconds.count() > 0)
            std::this_thread::sleep_for(seconds);
    }
};

inline std::shared_ptr<Clock> default_clock() {
    return std::make_shared<SteadyClock>();
}

}  // namespace Core
}  // namespace Bulwark
