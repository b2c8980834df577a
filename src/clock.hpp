// clock.hpp

#pragma once

#include <chrono>

// Every timed wait in the capture loop goes through a Clock so tests can
// simulate hours of scheduling without sleeping.
class Clock {
public:
    typedef std::chrono::system_clock::time_point time_point;
    typedef std::chrono::milliseconds duration;

    virtual ~Clock() {}

    virtual time_point now() const = 0;
    virtual void sleep_for(duration d) = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration d) override;
};
