// clock.cpp

#include "clock.hpp"

#include <thread>

Clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(duration d) {
    if (d.count() > 0) {
        std::this_thread::sleep_for(d);
    }
}
