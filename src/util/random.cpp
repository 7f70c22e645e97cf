#include <cuuid/random.hpp>
#include <cuuid/log.hpp>
#include <chrono>
#include <fstream>
#include <random>

namespace cuuid {

void SystemRandom::fill(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }

    log::warn("/dev/urandom unavailable, using std::random_device fallback");
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

RandomSource& system_random() {
    static SystemRandom instance;
    return instance;
}

uint64_t unix_time_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace cuuid
