#include "../h/crypto.h"
#include "../h/exceptions.h"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <string>

uint32_t SecureRandom::nextWord() {
    unsigned char buf[sizeof(uint32_t)];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw Exceptions::RngError(std::string("RAND_bytes failed: ") + reason);
    }
    return static_cast<uint32_t>(buf[0]) |
           (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 24);
}

int SecureRandom::randomIndex(int bound) {
    if (bound <= 0) {
        throw Exceptions::RngError("bound must be positive");
    }

    // 2^32 mod bound. Words below this value are the surplus that would
    // favour small results after the reduction, so they are drawn again.
    const uint32_t range = static_cast<uint32_t>(bound);
    const uint32_t threshold = (0u - range) % range;

    uint32_t word;
    do {
        word = nextWord();
    } while (word < threshold);

    return static_cast<int>(word % range);
}
