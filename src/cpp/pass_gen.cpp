#include "../h/pass_gen.h"
#include "../h/exceptions.h"
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace {
    struct CharacterClass {
        bool PasswordConfig::*enabled;
        const char* chars;
    };

    const CharacterClass CHARACTER_CLASSES[] = {
        {&PasswordConfig::useLowercase, LOWERCASE_CHARS},
        {&PasswordConfig::useUppercase, UPPERCASE_CHARS},
        {&PasswordConfig::useNumbers, NUMBER_CHARS},
        {&PasswordConfig::useSpecial, SPECIAL_CHARS},
    };

    char pickFrom(const std::string& chars, RandomSource& rng) {
        try {
            return chars[rng.randomIndex(static_cast<int>(chars.size()))];
        } catch (const Exceptions::RngError& e) {
            throw Exceptions::RngError(std::string("failed to generate random index: ") + e.what());
        }
    }
}

void validateConfig(const PasswordConfig& config) {
    if (config.length < MIN_PASSWORD_LENGTH)
        throw Exceptions::InvalidLength(MIN_PASSWORD_LENGTH);

    if (!config.useLowercase && !config.useUppercase && !config.useNumbers && !config.useSpecial)
        throw Exceptions::NoCharacterClassSelected();
}

std::string buildCharacterSet(const PasswordConfig& config) {
    std::string chars;
    for (const auto& cls : CHARACTER_CLASSES) {
        if (config.*cls.enabled) chars += cls.chars;
    }
    return chars;
}

std::string generatePassword(const PasswordConfig& config, RandomSource& rng) {
    validateConfig(config);
    spdlog::debug("Generating password: length={} lower={} upper={} digits={} symbols={}",
                  config.length, config.useLowercase, config.useUppercase,
                  config.useNumbers, config.useSpecial);

    const std::string chars = buildCharacterSet(config);

    std::vector<char> password;
    password.reserve(config.length);

    // One character from every enabled class first
    for (const auto& cls : CHARACTER_CLASSES) {
        if (config.*cls.enabled) password.push_back(pickFrom(cls.chars, rng));
    }

    const int remaining = config.length - static_cast<int>(password.size());
    for (int i = 0; i < remaining; ++i) {
        password.push_back(pickFrom(chars, rng));
    }

    // Fisher-Yates, so the guaranteed characters do not stay at the front
    for (size_t n = password.size(); n > 1; --n) {
        int j;
        try {
            j = rng.randomIndex(static_cast<int>(n));
        } catch (const Exceptions::RngError& e) {
            throw Exceptions::RngError(std::string("failed to shuffle password: ") + e.what());
        }
        std::swap(password[n - 1], password[j]);
    }

    return std::string(password.begin(), password.end());
}
