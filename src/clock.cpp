#include "clock.hpp"

#include <chrono>

SteadyClock::SteadyClock() : start(std::chrono::steady_clock::now()) {}

float SteadyClock::now() const {
    return std::chrono::duration<float>(std::chrono::steady_clock::now() -
                                        start)
        .count();
}
