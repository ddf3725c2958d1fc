#include "deepsea/Errors.hpp"

namespace deepsea {

const char* ActionErrorName(ActionError e) noexcept
{
    switch (e)
    {
    case ActionError::None:                  return "None";
    case ActionError::UnknownDiver:          return "UnknownDiver";
    case ActionError::NotYourTurn:           return "NotYourTurn";
    case ActionError::DiverInactive:         return "DiverInactive";
    case ActionError::DescendWhileReturning: return "DescendWhileReturning";
    case ActionError::AscendWhileDescending: return "AscendWhileDescending";
    case ActionError::ReturnWithoutTreasure: return "ReturnWithoutTreasure";
    case ActionError::AlreadyReturning:      return "AlreadyReturning";
    case ActionError::DiveOver:              return "DiveOver";
    case ActionError::DiveInProgress:        return "DiveInProgress";
    case ActionError::NoDive:                return "NoDive";
    case ActionError::WrongRound:            return "WrongRound";
    case ActionError::SessionInProgress:     return "SessionInProgress";
    case ActionError::SessionOver:           return "SessionOver";
    }
    return "Unknown";
}

InvalidActionError::InvalidActionError(ActionError code)
    : std::runtime_error(std::string("invalid action: ") + ActionErrorName(code))
    , m_code(code)
{
}

InvalidActionError::InvalidActionError(ActionError code, const std::string& detail)
    : std::runtime_error(std::string("invalid action: ") + ActionErrorName(code) + " (" + detail + ")")
    , m_code(code)
{
}

} // namespace deepsea
