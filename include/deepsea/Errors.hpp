#pragma once
// include/deepsea/Errors.hpp
//
// Failure taxonomy shared by the dive engine and the session:
//  - ConfigurationError: structural misconfiguration, fatal to construction.
//  - InvalidActionError: a rejected decision or lifecycle call. The engine state is
//    unchanged and the caller may resubmit.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace deepsea {

enum class ActionError : std::uint8_t {
    None = 0,

    // Turn legality
    UnknownDiver,
    NotYourTurn,
    DiverInactive,
    DescendWhileReturning,
    AscendWhileDescending,
    ReturnWithoutTreasure,
    AlreadyReturning,

    // Lifecycle
    DiveOver,
    DiveInProgress,
    NoDive,
    WrongRound,
    SessionInProgress,
    SessionOver,
};

[[nodiscard]] const char* ActionErrorName(ActionError e) noexcept;

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

class InvalidActionError : public std::runtime_error {
public:
    explicit InvalidActionError(ActionError code);
    InvalidActionError(ActionError code, const std::string& detail);

    [[nodiscard]] ActionError code() const noexcept { return m_code; }

private:
    ActionError m_code;
};

} // namespace deepsea
