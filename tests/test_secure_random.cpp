#include <catch2/catch.hpp>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <openssl/evp.h>

#include "maritime_relay/errors.hpp"
#include "maritime_relay/secure_random.hpp"

using namespace maritime_relay;

namespace {

SecureRandom::Block encrypt_block(const SecureRandom::Key& key, const SecureRandom::Block& plain) {
    SecureRandom::Block cipher{};
    EVP_CIPHER_CTX* context = EVP_CIPHER_CTX_new();
    REQUIRE(context != nullptr);
    int length = 0;
    REQUIRE(EVP_EncryptInit_ex(context, EVP_aes_128_ecb(), nullptr, key.data(), nullptr) == 1);
    EVP_CIPHER_CTX_set_padding(context, 0);
    REQUIRE(EVP_EncryptUpdate(context, cipher.data(), &length, plain.data(), static_cast<int>(plain.size())) == 1);
    EVP_CIPHER_CTX_free(context);
    REQUIRE(length == 16);
    return cipher;
}

std::uint32_t big_endian_word(const SecureRandom::Block& block, std::size_t offset) {
    return (static_cast<std::uint32_t>(block[offset]) << 24) | (static_cast<std::uint32_t>(block[offset + 1]) << 16)
        | (static_cast<std::uint32_t>(block[offset + 2]) << 8) | static_cast<std::uint32_t>(block[offset + 3]);
}

}  // namespace

TEST_CASE("Output is AES of the incremented counter read big-endian") {
    const SecureRandom::Key key{};
    SecureRandom::Block counter{};
    counter.fill(0xFF);
    SecureRandom random{key, counter};

    // All-ones counter wraps to zero; AES-128 of the zero block under the zero key.
    REQUIRE(random.next(32) == 0x66e94bd4U);
    REQUIRE(random.next(32) == 0xef8a2c3bU);
    REQUIRE(random.next(32) == 0x884cfa59U);
    REQUIRE(random.next(32) == 0xca342b2eU);

    SecureRandom::Block next_counter{};
    next_counter[0] = 0x01;
    const SecureRandom::Block expected = encrypt_block(key, next_counter);
    for (std::size_t offset = 0; offset < expected.size(); offset += 4) {
        REQUIRE(random.next(32) == big_endian_word(expected, offset));
    }
}

TEST_CASE("Counter increments cascade from the first byte") {
    const SecureRandom::Key key{};
    SecureRandom::Block counter{};
    counter[0] = 0xFF;
    SecureRandom random{key, counter};

    SecureRandom::Block incremented{};
    incremented[1] = 0x01;
    const SecureRandom::Block expected = encrypt_block(key, incremented);
    REQUIRE(random.next(32) == big_endian_word(expected, 0));
}

TEST_CASE("Generators with the same key and counter agree") {
    SecureRandom::Key key{};
    key[3] = 0x42;
    SecureRandom::Block counter{};
    counter[7] = 0x99;
    SecureRandom first{key, counter};
    SecureRandom second{key, counter};
    for (int draw = 0; draw < 100; ++draw) {
        REQUIRE(first.next_long() == second.next_long());
    }
}

TEST_CASE("next(bits) keeps the top bits of a word") {
    const SecureRandom::Key key{};
    SecureRandom::Block counter{};
    counter.fill(0xFF);
    SecureRandom random{key, counter};
    REQUIRE(random.next(8) == 0x66U);
    REQUIRE_THROWS_AS(random.next(0), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next(33), std::invalid_argument);
}

TEST_CASE("Bounded integers stay in range and spread evenly") {
    SecureRandom& random = SecureRandom::current();
    constexpr int k_draws{100'000};
    constexpr int k_bound{10};
    std::array<int, k_bound> histogram{};
    for (int draw = 0; draw < k_draws; ++draw) {
        const std::int32_t value = random.next_int(k_bound);
        REQUIRE(value >= 0);
        REQUIRE(value < k_bound);
        ++histogram[static_cast<std::size_t>(value)];
    }
    for (const int count : histogram) {
        REQUIRE(count > 9'000);
        REQUIRE(count < 11'000);
    }

    for (int draw = 0; draw < 10'000; ++draw) {
        const std::int32_t power_of_two = random.next_int(1 << 20);
        REQUIRE(power_of_two >= 0);
        REQUIRE(power_of_two < (1 << 20));
        const std::int32_t ranged = random.next_int(-5, 5);
        REQUIRE(ranged >= -5);
        REQUIRE(ranged < 5);
    }
    REQUIRE(random.next_int(1) == 0);
}

TEST_CASE("Bounded integers reject empty ranges") {
    SecureRandom& random = SecureRandom::current();
    REQUIRE_THROWS_AS(random.next_int(0), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next_int(-3), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next_int(5, 5), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next_long(0), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next_long(10, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next_double(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next_double(2.0, 1.0), std::invalid_argument);
}

TEST_CASE("Bounded longs cover ranges wider than 32 bits") {
    SecureRandom& random = SecureRandom::current();
    constexpr std::int64_t k_bound{(std::int64_t{1} << 40) + 12'345};
    bool saw_upper_half = false;
    bool saw_lower_half = false;
    for (int draw = 0; draw < 10'000; ++draw) {
        const std::int64_t value = random.next_long(k_bound);
        REQUIRE(value >= 0);
        REQUIRE(value < k_bound);
        saw_upper_half = saw_upper_half || value >= k_bound / 2;
        saw_lower_half = saw_lower_half || value < k_bound / 2;
    }
    REQUIRE(saw_upper_half);
    REQUIRE(saw_lower_half);

    const std::int64_t max_bound = std::numeric_limits<std::int64_t>::max();
    for (int draw = 0; draw < 1'000; ++draw) {
        const std::int64_t value = random.next_long(max_bound);
        REQUIRE(value >= 0);
        REQUIRE(value < max_bound);
        const std::int64_t full_span = random.next_long(std::numeric_limits<std::int64_t>::min(), max_bound);
        REQUIRE(full_span < max_bound);
    }
}

TEST_CASE("Doubles fall in the unit interval") {
    SecureRandom& random = SecureRandom::current();
    double sum = 0.0;
    constexpr int k_draws{50'000};
    for (int draw = 0; draw < k_draws; ++draw) {
        const double value = random.next_double();
        REQUIRE(value >= 0.0);
        REQUIRE(value < 1.0);
        sum += value;
        const double ranged = random.next_double(-2.0, 3.0);
        REQUIRE(ranged >= -2.0);
        REQUIRE(ranged < 3.0);
    }
    REQUIRE(sum / k_draws == Approx(0.5).margin(0.01));
}

TEST_CASE("Gaussian draws are centred with unit variance") {
    SecureRandom& random = SecureRandom::current();
    constexpr int k_draws{50'000};
    double sum = 0.0;
    double sum_squares = 0.0;
    for (int draw = 0; draw < k_draws; ++draw) {
        const double value = random.next_gaussian();
        sum += value;
        sum_squares += value * value;
    }
    const double mean = sum / k_draws;
    REQUIRE(mean == Approx(0.0).margin(0.03));
    REQUIRE(sum_squares / k_draws - mean * mean == Approx(1.0).margin(0.05));
}

TEST_CASE("Text helpers produce well-formed strings") {
    SecureRandom& random = SecureRandom::current();
    const std::string hex = random.next_hex_string(32);
    REQUIRE(hex.size() == 32);
    REQUIRE(hex.find_first_not_of("0123456789ABCDEF") == std::string::npos);
    REQUIRE(random.next_hex_string(0).empty());

    const std::string uuid = random.next_uuid();
    REQUIRE(uuid.size() == 36);
    REQUIRE(uuid[8] == '-');
    REQUIRE(uuid[13] == '-');
    REQUIRE(uuid[14] == '4');
    REQUIRE(uuid[18] == '-');
    REQUIRE(std::string{"89ab"}.find(uuid[19]) != std::string::npos);
    REQUIRE(uuid[23] == '-');
    REQUIRE(random.next_uuid() != uuid);
}

TEST_CASE("Bounded identifiers stay below the bound") {
    SecureRandom& random = SecureRandom::current();
    const Id160 bound = Id160::parse("0000000000000000000000000000000000000a00");
    const Id160 least = Id160::parse("0000000000000000000000000000000000000900");
    for (int draw = 0; draw < 1'000; ++draw) {
        REQUIRE(random.next_id160(bound) < bound);
        const Id160 ranged = random.next_id160(least, bound);
        REQUIRE(ranged >= least);
        REQUIRE(ranged < bound);
    }
    REQUIRE(random.next_id160(Id160::parse("0000000000000000000000000000000000000001")).is_zero());
    REQUIRE_THROWS_AS(random.next_id160(Id160::zero()), std::invalid_argument);
    REQUIRE_THROWS_AS(random.next_id160(bound, least), std::invalid_argument);
}

TEST_CASE("Unbounded identifiers do not repeat") {
    SecureRandom& random = SecureRandom::current();
    std::set<Id160> seen;
    for (int draw = 0; draw < 1'000; ++draw) {
        REQUIRE(seen.insert(random.next_id160()).second);
    }
}

TEST_CASE("Each thread owns a distinct generator") {
    const SecureRandom* main_generator = &SecureRandom::current();
    REQUIRE(&SecureRandom::current() == main_generator);

    const SecureRandom* worker_generator = nullptr;
    std::thread worker([&worker_generator]() { worker_generator = &SecureRandom::current(); });
    worker.join();
    REQUIRE(worker_generator != main_generator);
}

TEST_CASE("Reseeding is not supported") {
    REQUIRE_THROWS_AS(SecureRandom::current().set_seed(42), UnsupportedOperationError);
}
