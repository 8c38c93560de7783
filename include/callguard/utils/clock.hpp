#pragma once

#include "callguard/model/types.hpp"

namespace callguard::utils {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

}
