#pragma once
// include/deepsea/dive/Die.hpp
#include <vector>

#include "deepsea/core/Rng.hpp"

namespace deepsea::dive {

// A die with outcomes 1..faces. Holds no state of its own beyond the borrowed
// random source, which must outlive the die.
class Die {
public:
    static constexpr int kDefaultFaces = 3;

    // Throws ConfigurationError if faces < 1.
    explicit Die(rng::RandomSource& random, int faces = kDefaultFaces);

    [[nodiscard]] int faces() const noexcept { return m_faces; }

    // One outcome in [1, faces].
    int roll();

    // Sum of `count` independent rolls (a movement roll is rollSum(2)).
    int rollSum(int count);

    // The individual outcomes of `count` rolls, in order.
    std::vector<int> rollEach(int count);

private:
    rng::RandomSource* m_random = nullptr;
    int m_faces = kDefaultFaces;
};

} // namespace deepsea::dive
