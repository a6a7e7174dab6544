#ifndef CRYPTO_H
#define CRYPTO_H

#include <cstdint>

// Source of uniformly distributed indexes used by the password generator
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Returns a value in [0, bound); throws Exceptions::RngError on failure
    virtual int randomIndex(int bound) = 0;
};

// RandomSource backed by the OpenSSL CSPRNG
class SecureRandom : public RandomSource {
private:
    // Read one 32-bit value from RAND_bytes
    static uint32_t nextWord();

public:
    SecureRandom() = default;

    // Rejection sampling keeps the result free of modulo bias
    int randomIndex(int bound) override;
};

#endif // CRYPTO_H
