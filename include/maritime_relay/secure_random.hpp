// === Secure Random ===========================================================
//
// Cryptographically strong random source confined to a single thread. Each
// thread lazily receives its own generator, keyed once from the operating
// system's entropy pool, that expands a 128-bit counter through AES-128 (a
// counter-mode DRBG). Because no state is shared, contended callers never
// serialize on a lock the way a process-wide secure generator would.
//
// Usage is always `SecureRandom::current().next_x(...)`: fetch the calling
// thread's instance, draw, and drop the reference. Never store the reference
// or hand it to another thread.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include <openssl/evp.h>

#include "maritime_relay/id160.hpp"

namespace maritime_relay {

/** @brief Fill @p bytes from the process-wide operating-system entropy source. */
void fill_secure_entropy(std::span<std::uint8_t> bytes);

class SecureRandom final {
  public:
    static constexpr std::size_t k_block_size_bytes{16};
    using Key = std::array<std::uint8_t, k_block_size_bytes>;
    using Block = std::array<std::uint8_t, k_block_size_bytes>;

    /** @brief Generator owned by the calling thread, created on first use. */
    static SecureRandom& current();

    /**
     * @brief Construct a generator from an explicit key and initial counter.
     *
     * The first block produced is the encryption of @p counter + 1. Intended for
     * known-answer checks; production callers use current().
     */
    SecureRandom(const Key& key, const Block& counter);

    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;
    SecureRandom(SecureRandom&&) = delete;
    SecureRandom& operator=(SecureRandom&&) = delete;
    ~SecureRandom() = default;

    /** @brief Next @p bits (1..32) uniformly random bits, right aligned. */
    std::uint32_t next(int bits);

    bool next_boolean();
    void next_bytes(std::span<std::uint8_t> bytes);

    std::int32_t next_int();
    /** @brief Uniform value in [0, bound); throws std::invalid_argument unless bound > 0. */
    std::int32_t next_int(std::int32_t bound);
    /** @brief Uniform value in [least, bound); throws std::invalid_argument unless least < bound. */
    std::int32_t next_int(std::int32_t least, std::int32_t bound);

    std::int64_t next_long();
    /** @brief Uniform value in [0, bound) without modulo bias; throws unless bound > 0. */
    std::int64_t next_long(std::int64_t bound);
    std::int64_t next_long(std::int64_t least, std::int64_t bound);

    /** @brief Uniform value in [0, 1) with 53 bits of precision. */
    double next_double();
    double next_double(double bound);
    double next_double(double least, double bound);

    /** @brief Standard normal deviate (polar Box-Muller, second value cached). */
    double next_gaussian();

    /** @brief Random string of @p length characters drawn from 0-9 and A-F. */
    std::string next_hex_string(std::size_t length);
    /** @brief RFC 4122 version 4 UUID in canonical textual form. */
    std::string next_uuid();

    Id160 next_id160();
    /** @brief Uniform identifier in [0, bound); throws std::invalid_argument for a zero bound. */
    Id160 next_id160(const Id160& bound);
    /** @brief Uniform identifier in [least, bound); throws std::invalid_argument unless least < bound. */
    Id160 next_id160(const Id160& least, const Id160& bound);

    /** @brief Always throws UnsupportedOperationError; the key is fixed for the generator's lifetime. */
    [[noreturn]] void set_seed(std::uint64_t seed);

  private:
    SecureRandom();

    void initialize(const Key& key, const Block& counter);
    void next_block();

    struct CipherContextDeleter final {
        void operator()(EVP_CIPHER_CTX* context) const noexcept;
    };

    std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter> cipher_context_;
    Block counter_{};
    Block block_cache_{};
    std::size_t block_index_{};
    bool have_next_gaussian_{};
    double next_gaussian_{};
};

}  // namespace maritime_relay
