#include "maritime_relay/secure_random.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include "maritime_relay/errors.hpp"

namespace maritime_relay {

namespace {

constexpr double k_double_unit{1.0 / static_cast<double>(1ULL << 53)}; /**< Scale turning 53 random bits into [0, 1). */
constexpr char k_hex_digits[] = "0123456789ABCDEF";

std::string openssl_error_string() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    return std::string{buffer.data()};
}

}  // namespace

void fill_secure_entropy(std::span<std::uint8_t> bytes) {
    if (bytes.empty()) {
        return;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("Secure entropy source failed: " + openssl_error_string());
    }
}

void SecureRandom::CipherContextDeleter::operator()(EVP_CIPHER_CTX* context) const noexcept {
    EVP_CIPHER_CTX_free(context);
}

SecureRandom& SecureRandom::current() {
    thread_local SecureRandom thread_random;
    return thread_random;
}

SecureRandom::SecureRandom() {
    Key key{};
    Block counter{};
    fill_secure_entropy(key);
    fill_secure_entropy(counter);
    initialize(key, counter);
}

SecureRandom::SecureRandom(const Key& key, const Block& counter) {
    initialize(key, counter);
}

void SecureRandom::initialize(const Key& key, const Block& counter) {
    cipher_context_.reset(EVP_CIPHER_CTX_new());
    if (!cipher_context_) {
        throw std::runtime_error("Unable to allocate AES cipher context: " + openssl_error_string());
    }
    if (EVP_EncryptInit_ex(cipher_context_.get(), EVP_aes_128_ecb(), nullptr, key.data(), nullptr) != 1) {
        throw std::runtime_error("Unable to initialize AES cipher: " + openssl_error_string());
    }
    EVP_CIPHER_CTX_set_padding(cipher_context_.get(), 0);
    counter_ = counter;
    next_block();
}

/**
 * @brief Increment the counter (little-endian cascade) and encrypt it into the block cache.
 *
 * A counter that wraps through all sixteen bytes back to zero is still a fresh
 * block; wraparound is not an error.
 */
void SecureRandom::next_block() {
    for (std::uint8_t& counter_byte : counter_) {
        if (++counter_byte != 0) {
            break;
        }
    }

    int output_length = 0;
    if (EVP_EncryptUpdate(cipher_context_.get(),
                          block_cache_.data(),
                          &output_length,
                          counter_.data(),
                          static_cast<int>(counter_.size())) != 1
        || output_length != static_cast<int>(block_cache_.size())) {
        throw std::runtime_error("Failed creating next random block: " + openssl_error_string());
    }
    block_index_ = 0;
}

std::uint32_t SecureRandom::next(int bits) {
    if (bits < 1 || bits > 32) {
        throw std::invalid_argument(fmt::format("bits must be within [1, 32], got {}", bits));
    }
    if (block_cache_.size() - block_index_ < 4) {
        next_block();
    }
    const std::uint32_t result = (static_cast<std::uint32_t>(block_cache_[block_index_]) << 24)
        | (static_cast<std::uint32_t>(block_cache_[block_index_ + 1]) << 16)
        | (static_cast<std::uint32_t>(block_cache_[block_index_ + 2]) << 8)
        | static_cast<std::uint32_t>(block_cache_[block_index_ + 3]);
    block_index_ += 4;
    return result >> (32 - bits);
}

bool SecureRandom::next_boolean() {
    return next(1) != 0;
}

void SecureRandom::next_bytes(std::span<std::uint8_t> bytes) {
    std::size_t index = 0;
    while (index < bytes.size()) {
        std::uint32_t random_word = next(32);
        for (int remaining = 4; remaining > 0 && index < bytes.size(); --remaining) {
            bytes[index++] = static_cast<std::uint8_t>(random_word & 0xFFU);
            random_word >>= 8;
        }
    }
}

std::int32_t SecureRandom::next_int() {
    return static_cast<std::int32_t>(next(32));
}

std::int32_t SecureRandom::next_int(std::int32_t bound) {
    if (bound <= 0) {
        throw std::invalid_argument(fmt::format("bound must be positive, got {}", bound));
    }
    if ((bound & -bound) == bound) {
        return static_cast<std::int32_t>((static_cast<std::int64_t>(bound) * next(31)) >> 31);
    }
    // Reject draws from the final partial bucket so every residue is equally likely.
    std::int64_t bits = 0;
    std::int64_t value = 0;
    do {
        bits = next(31);
        value = bits % bound;
    } while (bits - value + (bound - 1) > std::numeric_limits<std::int32_t>::max());
    return static_cast<std::int32_t>(value);
}

std::int32_t SecureRandom::next_int(std::int32_t least, std::int32_t bound) {
    if (least >= bound) {
        throw std::invalid_argument(fmt::format("least ({}) must be less than bound ({})", least, bound));
    }
    const std::int64_t span = static_cast<std::int64_t>(bound) - least;
    if (span <= std::numeric_limits<std::int32_t>::max()) {
        return static_cast<std::int32_t>(least + next_int(static_cast<std::int32_t>(span)));
    }
    return static_cast<std::int32_t>(least + next_long(span));
}

std::int64_t SecureRandom::next_long() {
    const std::uint64_t high = next(32);
    const std::uint64_t low = next(32);
    return static_cast<std::int64_t>((high << 32) | low);
}

std::int64_t SecureRandom::next_long(std::int64_t bound) {
    if (bound <= 0) {
        throw std::invalid_argument(fmt::format("bound must be positive, got {}", bound));
    }
    // Halve the range until it fits next_int. Each round spends two bits: one
    // picks the upper or lower half, the other whether the half's offset is
    // added. Odd ranges make the halves differ by one, which the choice accounts for.
    std::int64_t offset = 0;
    std::int64_t range = bound;
    while (range >= std::numeric_limits<std::int32_t>::max()) {
        const std::uint32_t bits = next(2);
        const std::int64_t half = range >> 1;
        const std::int64_t next_range = (bits & 2U) == 0 ? half : range - half;
        if ((bits & 1U) == 0) {
            offset += range - next_range;
        }
        range = next_range;
    }
    return offset + next_int(static_cast<std::int32_t>(range));
}

std::int64_t SecureRandom::next_long(std::int64_t least, std::int64_t bound) {
    if (least >= bound) {
        throw std::invalid_argument(fmt::format("least ({}) must be less than bound ({})", least, bound));
    }
    const std::uint64_t span = static_cast<std::uint64_t>(bound) - static_cast<std::uint64_t>(least);
    if (span > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        std::int64_t candidate = 0;
        do {
            candidate = next_long();
        } while (candidate < least || candidate >= bound);
        return candidate;
    }
    return least + next_long(static_cast<std::int64_t>(span));
}

double SecureRandom::next_double() {
    const std::uint64_t high = next(26);
    const std::uint64_t low = next(27);
    return static_cast<double>((high << 27) + low) * k_double_unit;
}

double SecureRandom::next_double(double bound) {
    if (!(bound > 0.0)) {
        throw std::invalid_argument(fmt::format("bound must be positive, got {}", bound));
    }
    return next_double() * bound;
}

double SecureRandom::next_double(double least, double bound) {
    if (!(least < bound)) {
        throw std::invalid_argument(fmt::format("least ({}) must be less than bound ({})", least, bound));
    }
    return next_double() * (bound - least) + least;
}

double SecureRandom::next_gaussian() {
    // Knuth, TAOCP vol. 2, 3.4.1 algorithm P.
    if (have_next_gaussian_) {
        have_next_gaussian_ = false;
        return next_gaussian_;
    }
    double v1 = 0.0;
    double v2 = 0.0;
    double s = 0.0;
    do {
        v1 = 2.0 * next_double() - 1.0;
        v2 = 2.0 * next_double() - 1.0;
        s = v1 * v1 + v2 * v2;
    } while (s >= 1.0 || s == 0.0);
    const double norm = std::sqrt(-2.0 * std::log(s) / s);
    next_gaussian_ = v2 * norm;
    have_next_gaussian_ = true;
    return v1 * norm;
}

std::string SecureRandom::next_hex_string(std::size_t length) {
    std::string str_hex;
    str_hex.reserve(length);
    for (std::size_t index = 0; index < length; ++index) {
        str_hex.push_back(k_hex_digits[next(4)]);
    }
    return str_hex;
}

std::string SecureRandom::next_uuid() {
    std::array<std::uint8_t, 16> bytes{};
    next_bytes(bytes);
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);

    std::string str_uuid;
    str_uuid.reserve(36);
    for (std::size_t index = 0; index < bytes.size(); ++index) {
        if (index == 4 || index == 6 || index == 8 || index == 10) {
            str_uuid.push_back('-');
        }
        str_uuid += fmt::format("{:02x}", bytes[index]);
    }
    return str_uuid;
}

Id160 SecureRandom::next_id160() {
    Id160::Bytes bytes{};
    next_bytes(bytes);
    return Id160{bytes};
}

Id160 SecureRandom::next_id160(const Id160& bound) {
    if (bound.is_zero()) {
        throw std::invalid_argument("Id160 bound must be positive");
    }
    // Draw only as many bits as the bound needs and reject values at or above it;
    // each attempt succeeds with probability above one half.
    const int bit_length = bound.bit_length();
    const std::size_t leading_zero_bytes = Id160::k_size_bytes - static_cast<std::size_t>((bit_length + 7) / 8);
    const int top_bits = bit_length % 8 == 0 ? 8 : bit_length % 8;
    const auto top_mask = static_cast<std::uint8_t>((1U << top_bits) - 1U);
    while (true) {
        Id160::Bytes bytes{};
        next_bytes(std::span<std::uint8_t>{bytes}.subspan(leading_zero_bytes));
        bytes[leading_zero_bytes] &= top_mask;
        const Id160 candidate{bytes};
        if (candidate < bound) {
            return candidate;
        }
    }
}

Id160 SecureRandom::next_id160(const Id160& least, const Id160& bound) {
    if (!(least < bound)) {
        throw std::invalid_argument("Id160 least must be less than bound");
    }
    return least.add(next_id160(bound.subtract(least)));
}

void SecureRandom::set_seed(std::uint64_t) {
    throw UnsupportedOperationError("SecureRandom cannot be reseeded after construction");
}

}  // namespace maritime_relay
