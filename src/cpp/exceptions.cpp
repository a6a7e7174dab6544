#include "../h/exceptions.h"

namespace Exceptions {
    GenerationError::GenerationError(const std::string& message) : std::runtime_error(message) {}

    InvalidLength::InvalidLength(int minLength)
        : GenerationError("password length must be at least " + std::to_string(minLength) + " characters") {}

    NoCharacterClassSelected::NoCharacterClassSelected()
        : GenerationError("at least one character type must be selected") {}

    RngError::RngError(const std::string& message) : GenerationError(message) {}

    InputError::InputError(const std::string& message) : std::runtime_error(message) {}
}
