#ifndef MENU_H
#define MENU_H

#include <iosfwd>
#include <string>
#include "crypto.h"

class Menu {
public:
    Menu(std::istream& in, std::ostream& out, RandomSource& rng);

    // Runs one interactive session; returns the process exit status
    int run();

    // Parses a whole base-10 int, surrounding whitespace allowed
    static bool parseLength(const std::string& input, int& length);

private:
    std::istream& in;
    std::ostream& out;
    RandomSource& rng;

    // Prints the prompt and reads one trimmed line; false on end of input
    bool readUserInput(const std::string& prompt, std::string& line);
    int readLength();
    bool readYesNo(const std::string& prompt);
};

#endif
