#pragma once
// include/deepsea/core/Rng.hpp
#include <cstdint>

namespace deepsea::rng {

using Seed = std::uint64_t;

// 64-bit mixing (turns small seeds and IDs into well-scrambled seeds)
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// Derive a child seed from a parent seed and a stable numeric ID
inline Seed derive(Seed parent, std::uint64_t id) {
    return mix64(parent ^ mix64(id));
}

// Random source injected into everything that rolls or shuffles.
// Tests replace it with a scripted sequence.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform on [0, bound). bound == 0 yields 0.
    virtual std::uint32_t nextBounded(std::uint32_t bound) = 0;
};

// Minimal PCG32 (XSH-RR). One 64-bit state + 64-bit stream/sequence.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 0; // must be odd

    Pcg32() = default;
    Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    // sequence selects the stream; different sequences are independent
    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();              // advance once with zero state
        state += mix64(initstate);
        next_u32();              // advance again with real state
    }

    std::uint32_t next_u32() {
        std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    // Uniform on [0, bound) without modulo bias (rejection method)
    std::uint32_t next_bounded(std::uint32_t bound) {
        if (bound == 0) return 0;
        std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }
};

class Pcg32Source final : public RandomSource {
public:
    explicit Pcg32Source(Seed seed, Seed stream = 0) : m_gen(seed, stream) {}

    std::uint32_t nextBounded(std::uint32_t bound) override { return m_gen.next_bounded(bound); }

private:
    Pcg32 m_gen;
};

} // namespace deepsea::rng
