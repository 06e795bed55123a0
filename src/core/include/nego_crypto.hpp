#ifndef NEGO_CRYPTO_HPP
#define NEGO_CRYPTO_HPP

#include <vector>
#include <string>
#include <array>
#include <cstdint>
#include <cstddef>

namespace nego {

/**
 * @brief Initialize libsodium once per process.
 * @throws std::runtime_error if sodium_init() fails
 */
void init_crypto();

/**
 * @brief Hash used to turn a public seed string into a stream key
 */
enum class SeedHash {
    BLAKE2B_256,   // crypto_generichash, 32-byte output
    SHA256         // crypto_hash_sha256
};

/**
 * @brief Sequential source of pseudorandom bytes.
 *
 * Position derivation reads tags from one of these. Tests substitute
 * scripted streams to force specific slot choices.
 */
class KeyStream {
public:
    virtual ~KeyStream() = default;

    // Fill out[0..len) with the next len bytes of the stream
    virtual void read(uint8_t* out, size_t len) = 0;

    uint32_t next_u32_be();
};

/**
 * @brief Public deterministic stream: ChaCha20-IETF keystream under H(seed)
 *
 * No secret material goes in; anyone knowing the seed reproduces the
 * same bytes. The nonce is all-zero and the block counter advances
 * across reads, so splitting a read at any boundary yields the same
 * bytes as one large read.
 */
class HashStream : public KeyStream {
public:
    static constexpr size_t KEY_SIZE   = 32;
    static constexpr size_t BLOCK_SIZE = 64;

    HashStream(const std::string& seed, SeedHash hash);
    ~HashStream() override;

    HashStream(const HashStream&) = delete;
    HashStream& operator=(const HashStream&) = delete;

    void read(uint8_t* out, size_t len) override;

    uint64_t position() const { return consumed_; }

private:
    void refill();

    std::array<uint8_t, KEY_SIZE> key_{};
    std::array<uint8_t, BLOCK_SIZE> block_{};
    size_t block_pos_ = BLOCK_SIZE;
    uint32_t counter_ = 0;
    uint64_t consumed_ = 0;
};

/**
 * @brief Randomness handed to header emission collaborators
 *
 * Layout computation is deterministic and never reads from it.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void fill(uint8_t* out, size_t len) = 0;

    std::vector<uint8_t> bytes(size_t len) {
        std::vector<uint8_t> out(len);
        if (len > 0) fill(out.data(), len);
        return out;
    }
};

/**
 * @brief RandomSource backed by libsodium's randombytes_buf()
 */
class SodiumRandom : public RandomSource {
public:
    SodiumRandom();
    void fill(uint8_t* out, size_t len) override;
};

} // namespace nego

#endif // NEGO_CRYPTO_HPP
