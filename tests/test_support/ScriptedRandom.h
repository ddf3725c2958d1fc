// tests/test_support/ScriptedRandom.h
#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

#include "deepsea/core/Rng.hpp"

namespace deepsea::test {

// Replays die faces (1-based) in order: nextBounded() returns face - 1.
// Running past the end of the script throws so a test cannot silently roll
// values it never planned for.
class ScriptedRandom final : public rng::RandomSource {
public:
    ScriptedRandom(std::initializer_list<int> faces) : m_faces(faces) {}
    explicit ScriptedRandom(std::vector<int> faces) : m_faces(std::move(faces)) {}

    std::uint32_t nextBounded(std::uint32_t bound) override
    {
        if (m_next >= m_faces.size())
            throw std::out_of_range("ScriptedRandom: script exhausted");

        const int face = m_faces[m_next++];
        if (face < 1 || static_cast<std::uint32_t>(face) > bound)
            throw std::out_of_range("ScriptedRandom: scripted face out of range");
        return static_cast<std::uint32_t>(face - 1);
    }

    [[nodiscard]] std::size_t consumed() const noexcept { return m_next; }
    [[nodiscard]] std::size_t remaining() const noexcept { return m_faces.size() - m_next; }

private:
    std::vector<int> m_faces;
    std::size_t m_next = 0;
};

} // namespace deepsea::test
