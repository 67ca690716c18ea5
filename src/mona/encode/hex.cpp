#include <mona/encode/hex.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace mona::encode {

namespace {

constexpr std::string_view hex_digits = "0123456789abcdef";
constexpr std::string_view hex_prefix = "0x";
constexpr std::uint8_t nibble_bits    = 4;
constexpr std::uint8_t nibble_mask    = 0x0f;

constexpr std::optional< std::uint8_t > nibble( char c ) noexcept
{
  if( c >= '0' && c <= '9' )
    return static_cast< std::uint8_t >( c - '0' );

  if( c >= 'a' && c <= 'f' )
    return static_cast< std::uint8_t >( c - 'a' + 10 );

  if( c >= 'A' && c <= 'F' )
    return static_cast< std::uint8_t >( c - 'A' + 10 );

  return std::nullopt;
}

} // namespace

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string str( hex_prefix );
  str.reserve( hex_prefix.size() + s.size() * 2 );

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( hex_digits[ value >> nibble_bits ] );
    str.push_back( hex_digits[ value & nibble_mask ] );
  }

  return str;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( hex_prefix.size() );

  if( sv.size() % 2 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes( sv.size() / 2 );

  for( std::size_t i = 0; i < bytes.size(); ++i )
  {
    auto high = nibble( sv[ 2 * i ] );
    auto low  = nibble( sv[ 2 * i + 1 ] );

    if( !high || !low )
      return std::unexpected( encode_errc::invalid_character );

    bytes[ i ] = static_cast< std::byte >( *high << nibble_bits | *low );
  }

  return bytes;
}

} // namespace mona::encode
