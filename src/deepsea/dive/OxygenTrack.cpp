#include "deepsea/dive/OxygenTrack.hpp"

#include <algorithm>
#include <string>

#include "deepsea/Errors.hpp"

namespace deepsea::dive {

OxygenTrack::OxygenTrack(int maximum)
    : m_maximum(maximum)
    , m_remaining(maximum)
{
    if (maximum <= 0)
        throw ConfigurationError("OxygenTrack: maximum must be > 0, got " + std::to_string(maximum));
}

bool OxygenTrack::consume(int amount) noexcept
{
    m_remaining = std::max(0, m_remaining - std::max(0, amount));
    return exhausted();
}

} // namespace deepsea::dive
