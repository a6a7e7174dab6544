#include "../h/menu.h"
#include "../h/crypto.h"
#include "../h/logger.h"
#include <stdexcept>
#include <iostream>

int main() {
    try {
        Log::init();
        SecureRandom rng;
        Menu menu(std::cin, std::cout, rng);
        return menu.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
