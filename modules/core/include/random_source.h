#ifndef MASQUEPLUS_RANDOM_SOURCE_H
#define MASQUEPLUS_RANDOM_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

namespace masqueplus {

// Uniform index source used for port picks, shuffles and fallback endpoint
// choice. Injected so that runs can be made reproducible.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Returns a value in [0, upper). upper must be > 0.
    virtual size_t uniform(size_t upper) = 0;
};

// libsodium CSPRNG. Throws std::runtime_error if sodium_init() fails.
class SodiumRandomSource : public RandomSource {
public:
    SodiumRandomSource();
    size_t uniform(size_t upper) override;
};

class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : m_engine(seed) {}
    size_t uniform(size_t upper) override;

private:
    std::mt19937_64 m_engine;
};

// seed == 0 selects the libsodium source.
std::unique_ptr<RandomSource> make_random_source(uint64_t seed);

} // namespace masqueplus

#endif // MASQUEPLUS_RANDOM_SOURCE_H
