#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Exceptions {
    // Base for everything generatePassword() can throw
    class GenerationError : public std::runtime_error {
    public:
        explicit GenerationError(const std::string& message);
    };

    // Requested length is below MIN_PASSWORD_LENGTH
    class InvalidLength : public GenerationError {
    public:
        explicit InvalidLength(int minLength);
    };

    class NoCharacterClassSelected : public GenerationError {
    public:
        NoCharacterClassSelected();
    };

    // The random source could not produce a value
    class RngError : public GenerationError {
    public:
        explicit RngError(const std::string& message);
    };

    // Input stream ran out before the session got an answer
    class InputError : public std::runtime_error {
    public:
        explicit InputError(const std::string& message);
    };
}

#endif // EXCEPTIONS_H
