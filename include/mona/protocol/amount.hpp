#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include <mona/encode/error.hpp>

namespace mona::protocol {

using amount = boost::multiprecision::uint256_t;

constexpr std::size_t amount_length = 32;

using amount_bytes = std::array< std::byte, amount_length >;

/**
 * Amounts travel as 32 byte big-endian integers.
 */
amount_bytes to_bytes( const amount& a );
amount from_bytes( std::span< const std::byte > bytes );

/**
 * Parses a base ten amount. Fails on an empty string, a non-digit character
 * or a value that does not fit in 256 bits.
 */
encode::result< amount > amount_from_string( std::string_view sv ) noexcept;

/**
 * Returns value * 10^decimals.
 */
amount scale( std::uint64_t value, std::uint32_t decimals );

} // namespace mona::protocol
