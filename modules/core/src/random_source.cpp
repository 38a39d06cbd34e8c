#include "random_source.h"

#include <sodium.h>

#include <limits>
#include <stdexcept>

namespace masqueplus {

SodiumRandomSource::SodiumRandomSource() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

size_t SodiumRandomSource::uniform(size_t upper) {
    if (upper <= 1) {
        return 0;
    }
    if (upper <= std::numeric_limits<uint32_t>::max()) {
        return static_cast<size_t>(randombytes_uniform(static_cast<uint32_t>(upper)));
    }
    // Candidate lists never get this large; rejection-sample on 64 bits anyway.
    const uint64_t limit = std::numeric_limits<uint64_t>::max() - (std::numeric_limits<uint64_t>::max() % upper);
    uint64_t value = 0;
    do {
        randombytes_buf(&value, sizeof(value));
    } while (value >= limit);
    return static_cast<size_t>(value % upper);
}

size_t SeededRandomSource::uniform(size_t upper) {
    if (upper <= 1) {
        return 0;
    }
    std::uniform_int_distribution<size_t> dist(0, upper - 1);
    return dist(m_engine);
}

std::unique_ptr<RandomSource> make_random_source(uint64_t seed) {
    if (seed == 0) {
        return std::make_unique<SodiumRandomSource>();
    }
    return std::make_unique<SeededRandomSource>(seed);
}

} // namespace masqueplus
