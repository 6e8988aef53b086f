// === 160-bit Identifier ======================================================
//
// Immutable 160-bit unsigned value used to identify targets and sessions.
// Stored big-endian so that byte-wise comparison matches numeric ordering.

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace maritime_relay {

class Id160 final {
  public:
    static constexpr std::size_t k_size_bytes{20};
    using Bytes = std::array<std::uint8_t, k_size_bytes>;

    /** @brief The zero identifier. */
    constexpr Id160() = default;
    constexpr explicit Id160(const Bytes& bytes) : bytes_(bytes) {}

    /** @brief Identifier with every bit cleared. */
    [[nodiscard]] static Id160 zero() noexcept;
    /** @brief Identifier with every bit set. */
    [[nodiscard]] static Id160 max() noexcept;
    /** @brief Parse exactly 40 hexadecimal digits (either case). */
    [[nodiscard]] static Id160 parse(std::string_view hex);

    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }
    [[nodiscard]] bool is_zero() const noexcept;
    /** @brief Number of significant bits (0 for zero). */
    [[nodiscard]] int bit_length() const noexcept;

    /** @brief Lowercase hexadecimal rendering, 40 characters. */
    [[nodiscard]] std::string to_string() const;

    /** @brief Sum modulo 2^160. */
    [[nodiscard]] Id160 add(const Id160& other) const noexcept;
    /** @brief Difference modulo 2^160. */
    [[nodiscard]] Id160 subtract(const Id160& other) const noexcept;

    friend constexpr auto operator<=>(const Id160&, const Id160&) = default;

  private:
    Bytes bytes_{};
};

struct Id160Hash final {
    std::size_t operator()(const Id160& id) const noexcept;
};

}  // namespace maritime_relay

namespace std {

template <>
struct hash<maritime_relay::Id160> {
    std::size_t operator()(const maritime_relay::Id160& id) const noexcept {
        return maritime_relay::Id160Hash{}(id);
    }
};

}  // namespace std
