#pragma once

#include <cstddef>
#include <cstdint>

namespace cuuid {

// Entropy used by the UUID generators. Implementations shared across
// threads must be safe to call concurrently.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void fill(uint8_t* buf, size_t len) = 0;
};

// Reads /dev/urandom on every call; falls back to a std::random_device
// seeded mt19937_64 when the device is unavailable. Holds no state.
class SystemRandom : public RandomSource {
public:
    void fill(uint8_t* buf, size_t len) override;
};

// Process-wide SystemRandom used by the no-argument generators
RandomSource& system_random();

// Milliseconds since the Unix epoch from the system clock
uint64_t unix_time_ms();

} // namespace cuuid
