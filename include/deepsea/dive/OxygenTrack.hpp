#pragma once
// include/deepsea/dive/OxygenTrack.hpp

namespace deepsea::dive {

// Shared countdown for one dive. remaining() never goes below zero and never
// increases; each dive builds a fresh track.
class OxygenTrack {
public:
    // Throws ConfigurationError if maximum <= 0.
    explicit OxygenTrack(int maximum);

    [[nodiscard]] int maximum() const noexcept { return m_maximum; }
    [[nodiscard]] int remaining() const noexcept { return m_remaining; }
    [[nodiscard]] bool exhausted() const noexcept { return m_remaining == 0; }

    // Decreases remaining by `amount` (negative amounts count as 0), clamped at 0.
    // Returns true if the track is now exhausted.
    bool consume(int amount) noexcept;

private:
    int m_maximum   = 0;
    int m_remaining = 0;
};

} // namespace deepsea::dive
