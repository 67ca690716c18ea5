#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <mona/encode/error.hpp>

namespace mona::protocol {

constexpr std::size_t account_length = 20;

using account = std::array< std::byte, account_length >;

constexpr account null_account{};

bool is_null( const account& a ) noexcept;

std::string to_hex( const account& a ) noexcept;
encode::result< account > account_from_hex( std::string_view sv ) noexcept;

/**
 * Builds a well known account by copying up to account_length characters of
 * the string, zero padded.
 */
constexpr account system_account( std::string_view str ) noexcept
{
  account a{};
  std::size_t length = std::min( str.length(), a.size() );
  for( std::size_t i = 0; i < length; ++i )
    a[ i ] = static_cast< std::byte >( str[ i ] );
  return a;
}

} // namespace mona::protocol

template<>
struct std::hash< mona::protocol::account >
{
  std::size_t operator()( const mona::protocol::account& arr ) const noexcept
  {
    std::size_t seed = 0;
    for( const auto& value: arr )
    {
      seed ^= std::hash< std::byte >()( value ) + 0x9e3779b9 + ( seed << 6 ) + ( seed >> 2 );
    }
    return seed;
  }
};
