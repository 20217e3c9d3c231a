#include <ctrlc/core/InitGuard.hpp>

namespace ctrlc::core
{

std::string_view registrationStateName(RegistrationState s) noexcept
{
    switch (s)
    {
    case RegistrationState::Uninitialized:
        return "Uninitialized";
    case RegistrationState::Initializing:
        return "Initializing";
    case RegistrationState::Initialized:
        return "Initialized";
    }
    return "Unknown";
}

} // namespace ctrlc::core
