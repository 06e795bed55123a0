/**
 * @file crypto.cpp
 * @brief Public key streams and randomness for header layout
 * @note libsodium is REQUIRED - no fallback implementations
 */

#include "../include/nego_crypto.hpp"
#include <stdexcept>
#include <cstring>
#include <algorithm>

// libsodium is required - no fallback implementations allowed
#ifndef HAVE_SODIUM
#error "libsodium is required for cryptographic operations. Please install libsodium and rebuild with -DHAVE_SODIUM=ON"
#endif

#include <sodium.h>

namespace nego {

static_assert(HashStream::KEY_SIZE == crypto_stream_chacha20_ietf_KEYBYTES,
              "ChaCha20-IETF key size mismatch");
static_assert(crypto_hash_sha256_BYTES == HashStream::KEY_SIZE,
              "SHA-256 digest must fill the stream key");

void init_crypto() {
    // sodium_init() returns 1 when already initialized
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

uint32_t KeyStream::next_u32_be() {
    uint8_t buf[4] = {0, 0, 0, 0};
    read(buf, sizeof(buf));
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8)  |
            static_cast<uint32_t>(buf[3]);
}

// ==================== HashStream ====================

HashStream::HashStream(const std::string& seed, SeedHash hash) {
    init_crypto();

    const auto* in = reinterpret_cast<const unsigned char*>(seed.data());
    switch (hash) {
        case SeedHash::BLAKE2B_256:
            if (crypto_generichash(key_.data(), key_.size(),
                                   in, seed.size(), nullptr, 0) != 0) {
                throw std::runtime_error("BLAKE2b seed hashing failed");
            }
            break;
        case SeedHash::SHA256:
            crypto_hash_sha256(key_.data(), in, seed.size());
            break;
    }
}

HashStream::~HashStream() {
    sodium_memzero(key_.data(), key_.size());
    sodium_memzero(block_.data(), block_.size());
}

void HashStream::refill() {
    static const uint8_t zero_nonce[crypto_stream_chacha20_ietf_NONCEBYTES] = {0};

    block_.fill(0);
    // XOR over zeros yields the raw keystream for this block
    if (crypto_stream_chacha20_ietf_xor_ic(block_.data(), block_.data(), block_.size(),
                                           zero_nonce, counter_, key_.data()) != 0) {
        throw std::runtime_error("ChaCha20 keystream generation failed");
    }
    ++counter_;
    block_pos_ = 0;
}

void HashStream::read(uint8_t* out, size_t len) {
    while (len > 0) {
        if (block_pos_ == BLOCK_SIZE) refill();
        size_t take = std::min(len, BLOCK_SIZE - block_pos_);
        std::memcpy(out, block_.data() + block_pos_, take);
        block_pos_ += take;
        consumed_ += take;
        out += take;
        len -= take;
    }
}

// ==================== SodiumRandom ====================

SodiumRandom::SodiumRandom() {
    init_crypto();
}

void SodiumRandom::fill(uint8_t* out, size_t len) {
    randombytes_buf(out, len);
}

} // namespace nego
