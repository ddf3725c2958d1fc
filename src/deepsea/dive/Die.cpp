#include "deepsea/dive/Die.hpp"

#include <cstdint>
#include <string>

#include "deepsea/Errors.hpp"

namespace deepsea::dive {

Die::Die(rng::RandomSource& random, int faces)
    : m_random(&random)
    , m_faces(faces)
{
    if (faces < 1)
        throw ConfigurationError("Die: faces must be >= 1, got " + std::to_string(faces));
}

int Die::roll()
{
    return 1 + static_cast<int>(m_random->nextBounded(static_cast<std::uint32_t>(m_faces)));
}

int Die::rollSum(int count)
{
    int total = 0;
    for (int i = 0; i < count; ++i)
        total += roll();
    return total;
}

std::vector<int> Die::rollEach(int count)
{
    std::vector<int> out;
    if (count <= 0)
        return out;

    out.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
        out.push_back(roll());
    return out;
}

} // namespace deepsea::dive
