#include "callguard/utils/clock.hpp"

namespace callguard::utils {

Timestamp SystemClock::now() const {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

}
