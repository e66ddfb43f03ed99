#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "prefixtree/status.hpp"

namespace prefixtree {

/**
 * @brief Big-endian address or mask bytes, most significant bit first.
 */
using AddressBytes = std::vector<uint8_t>;

constexpr size_t ADDRESS_WIDTH = 16;   ///< Canonical width in bytes (IPv6)
constexpr size_t IPV4_WIDTH = 4;
constexpr size_t IPV4_OFFSET = 12;     ///< IPv4 lives in the last 4 bytes of ::ffff:0:0/96
constexpr size_t IPV4_BIT_OFFSET = IPV4_OFFSET * 8;

/**
 * @brief Build a contiguous mask with `bits` leading set bits.
 *
 * @param bits Number of set bits from the most significant end; clamped to the width
 * @param width Mask width in bytes
 * @return Mask of exactly `width` bytes
 */
inline AddressBytes prefix_mask(size_t bits, size_t width = ADDRESS_WIDTH) {
    AddressBytes mask(width, 0);
    for (size_t i = 0; i < width && bits > 0; ++i) {
        if (bits >= 8) {
            mask[i] = 0xFF;
            bits -= 8;
        } else {
            mask[i] = static_cast<uint8_t>(0xFF << (8 - bits));
            bits = 0;
        }
    }
    return mask;
}

/**
 * @brief The 128-bit all-ones mask used for host lookups.
 *
 * Built once on first use and never modified afterwards.
 */
inline const AddressBytes& full_mask() {
    static const AddressBytes mask = prefix_mask(ADDRESS_WIDTH * 8);
    return mask;
}

/**
 * @brief Count the leading set bits of a mask.
 *
 * Counting stops at the first clear bit, so anything after a gap is ignored.
 */
inline size_t prefix_length(const AddressBytes& mask) {
    size_t bits = 0;
    for (uint8_t byte : mask) {
        if (byte == 0xFF) {
            bits += 8;
            continue;
        }
        for (uint8_t bit = 0x80; bit & byte; bit >>= 1) {
            ++bits;
        }
        break;
    }
    return bits;
}

namespace detail {

/**
 * @brief Parse a decimal prefix length no larger than `max_bits`.
 */
inline bool parse_length(const std::string& text, size_t max_bits, size_t& bits) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    if (value > max_bits) {
        return false;
    }
    bits = value;
    return true;
}

} // namespace detail

/**
 * @brief Normalize a textual address or CIDR into canonical address and mask.
 *
 * Accepted forms:
 * - "10.1.2.3", "2001:db8::1": host address, full 128-bit mask
 * - "10.0.0.0/8", "2001:db8::/32": prefix with a decimal length
 *
 * IPv4 input is embedded as ::ffff:a.b.c.d and its prefix length is shifted
 * by 96 bits, so both families share one 128-bit key space. Host bits below
 * the prefix length are kept as given; tree walks never read them.
 *
 * @param text Address text, optionally followed by "/len"
 * @param address Receives ADDRESS_WIDTH address bytes
 * @param mask Receives ADDRESS_WIDTH mask bytes
 * @return Status::Ok, or Status::BadAddress on any syntax or range error
 *         (outputs are left untouched on failure)
 */
inline Status parse_prefix(const std::string& text, AddressBytes& address, AddressBytes& mask) {
    std::string::size_type slash = text.find('/');
    std::string host = slash == std::string::npos ? text : text.substr(0, slash);

    AddressBytes parsed(ADDRESS_WIDTH, 0);
    size_t max_bits = 0;
    size_t bit_offset = 0;

    in_addr v4;
    in6_addr v6;
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        parsed[IPV4_OFFSET - 2] = 0xFF;
        parsed[IPV4_OFFSET - 1] = 0xFF;
        std::memcpy(parsed.data() + IPV4_OFFSET, &v4, IPV4_WIDTH);
        max_bits = IPV4_WIDTH * 8;
        bit_offset = IPV4_BIT_OFFSET;
    } else if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        std::memcpy(parsed.data(), &v6, ADDRESS_WIDTH);
        max_bits = ADDRESS_WIDTH * 8;
    } else {
        return Status::BadAddress;
    }

    if (slash == std::string::npos) {
        address = std::move(parsed);
        mask = full_mask();
        return Status::Ok;
    }

    size_t bits = 0;
    if (!detail::parse_length(text.substr(slash + 1), max_bits, bits)) {
        return Status::BadAddress;
    }

    address = std::move(parsed);
    mask = prefix_mask(bits + bit_offset);
    return Status::Ok;
}

} // namespace prefixtree
