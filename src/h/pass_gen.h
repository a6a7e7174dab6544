#ifndef PASS_GEN_H
#define PASS_GEN_H

#include <string>
#include "crypto.h"

const int MIN_PASSWORD_LENGTH = 6;

const char LOWERCASE_CHARS[] = "abcdefghijklmnopqrstuvwxyz";
const char UPPERCASE_CHARS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
const char NUMBER_CHARS[] = "0123456789";
const char SPECIAL_CHARS[] = "!@#$%^&*()_+-=[]{}|;:,.<>?";

struct PasswordConfig {
    int length = MIN_PASSWORD_LENGTH;
    bool useLowercase = false;
    bool useUppercase = false;
    bool useNumbers = false;
    bool useSpecial = false;
};

// Throws Exceptions::InvalidLength or Exceptions::NoCharacterClassSelected
void validateConfig(const PasswordConfig& config);

// Enabled character tables joined in the order lowercase, uppercase, digits, symbols
std::string buildCharacterSet(const PasswordConfig& config);

// Generates a password with at least one character of every enabled class.
// Nothing is drawn from rng before the config has been validated.
std::string generatePassword(const PasswordConfig& config, RandomSource& rng);

#endif // PASS_GEN_H
