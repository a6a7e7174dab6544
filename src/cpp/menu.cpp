#include "../h/menu.h"
#include "../h/pass_gen.h"
#include "../h/exceptions.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>

namespace {
    std::string trim(const std::string& s) {
        size_t begin = 0, end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(begin, end - begin);
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

Menu::Menu(std::istream& in, std::ostream& out, RandomSource& rng) : in(in), out(out), rng(rng) {}

bool Menu::parseLength(const std::string& input, int& length) {
    std::string s = trim(input);
    if (s.empty()) return false;

    // strtol would skip inner whitespace after a sign
    size_t digits = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (digits == s.size()) return false;
    for (size_t i = digits; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }

    errno = 0;
    long value = std::strtol(s.c_str(), nullptr, 10);
    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) return false;

    length = static_cast<int>(value);
    return true;
}

bool Menu::readUserInput(const std::string& prompt, std::string& line) {
    out << prompt << std::flush;
    if (!std::getline(in, line)) {
        line.clear();
        return false;
    }
    line = trim(line);
    return true;
}

int Menu::readLength() {
    std::string input;
    if (!readUserInput("Enter password length (minimum " + std::to_string(MIN_PASSWORD_LENGTH) + "): ", input)) {
        out << std::endl;
    }

    int length;
    if (!parseLength(input, length)) {
        out << "Error: Invalid length. Using minimum length of " << MIN_PASSWORD_LENGTH << std::endl;
        spdlog::info("Unparseable length '{}', falling back to {}", input, MIN_PASSWORD_LENGTH);
        length = MIN_PASSWORD_LENGTH;
    }
    return length;
}

bool Menu::readYesNo(const std::string& prompt) {
    std::string input;
    while (true) {
        if (!readUserInput(prompt, input)) {
            out << std::endl;
            throw Exceptions::InputError("unexpected end of input");
        }
        input = toLower(input);
        if (input == "y" || input == "yes") return true;
        if (input == "n" || input == "no") return false;
        out << "Please enter 'y' or 'n'" << std::endl;
    }
}

int Menu::run() {
    out << "Welcome to Pass-inator - Your Secure Password Generator" << std::endl;
    out << std::string(53, '-') << std::endl;

    PasswordConfig config;
    std::string password;
    try {
        config.length = readLength();
        config.useLowercase = readYesNo("Include lowercase letters? (y/n): ");
        config.useUppercase = readYesNo("Include uppercase letters? (y/n): ");
        config.useNumbers = readYesNo("Include numbers? (y/n): ");
        config.useSpecial = readYesNo("Include special characters? (y/n): ");

        password = generatePassword(config, rng);
    } catch (const Exceptions::GenerationError& e) {
        spdlog::error("Password generation failed: {}", e.what());
        out << "Error generating password: " << e.what() << std::endl;
        return 1;
    } catch (const Exceptions::InputError& e) {
        out << "Error: " << e.what() << std::endl;
        return 1;
    }

    out << "\nYour generated password is:" << std::endl;
    out << std::string(24, '-') << std::endl;
    out << password << std::endl;
    out << std::string(24, '-') << std::endl;
    return 0;
}
