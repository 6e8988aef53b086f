#include "maritime_relay/id160.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace maritime_relay {

namespace {
int hex_value(char character) {
    if (character >= '0' && character <= '9') {
        return character - '0';
    }
    if (character >= 'a' && character <= 'f') {
        return character - 'a' + 10;
    }
    if (character >= 'A' && character <= 'F') {
        return character - 'A' + 10;
    }
    return -1;
}
}  // namespace

Id160 Id160::zero() noexcept {
    return Id160{};
}

Id160 Id160::max() noexcept {
    Bytes bytes{};
    bytes.fill(0xFF);
    return Id160{bytes};
}

Id160 Id160::parse(std::string_view hex) {
    if (hex.size() != k_size_bytes * 2) {
        throw std::invalid_argument(fmt::format("Id160 requires {} hex digits, got {}", k_size_bytes * 2, hex.size()));
    }
    Bytes bytes{};
    for (std::size_t index = 0; index < k_size_bytes; ++index) {
        const int high = hex_value(hex[index * 2]);
        const int low = hex_value(hex[index * 2 + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument(fmt::format("Id160 contains a non-hex character: {}", hex));
        }
        bytes[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return Id160{bytes};
}

bool Id160::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t value) { return value == 0; });
}

int Id160::bit_length() const noexcept {
    for (std::size_t index = 0; index < k_size_bytes; ++index) {
        const std::uint8_t value = bytes_[index];
        if (value == 0) {
            continue;
        }
        int bits = 8;
        while ((value & (1U << (bits - 1))) == 0) {
            --bits;
        }
        return static_cast<int>((k_size_bytes - index - 1) * 8) + bits;
    }
    return 0;
}

std::string Id160::to_string() const {
    std::string str_hex;
    str_hex.reserve(k_size_bytes * 2);
    for (const std::uint8_t value : bytes_) {
        str_hex += fmt::format("{:02x}", value);
    }
    return str_hex;
}

Id160 Id160::add(const Id160& other) const noexcept {
    Bytes result{};
    unsigned carry = 0;
    for (std::size_t index = k_size_bytes; index-- > 0;) {
        const unsigned sum = static_cast<unsigned>(bytes_[index]) + other.bytes_[index] + carry;
        result[index] = static_cast<std::uint8_t>(sum & 0xFFU);
        carry = sum >> 8;
    }
    return Id160{result};
}

Id160 Id160::subtract(const Id160& other) const noexcept {
    Bytes result{};
    int borrow = 0;
    for (std::size_t index = k_size_bytes; index-- > 0;) {
        int difference = static_cast<int>(bytes_[index]) - other.bytes_[index] - borrow;
        borrow = difference < 0 ? 1 : 0;
        if (difference < 0) {
            difference += 256;
        }
        result[index] = static_cast<std::uint8_t>(difference);
    }
    return Id160{result};
}

std::size_t Id160Hash::operator()(const Id160& id) const noexcept {
    // FNV-1a over the raw bytes.
    std::uint64_t hash = 1469598103934665603ULL;
    for (const std::uint8_t value : id.bytes()) {
        hash ^= value;
        hash *= 1099511628211ULL;
    }
    return static_cast<std::size_t>(hash);
}

}  // namespace maritime_relay
