#include <mona/protocol/amount.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <vector>

namespace mona::protocol {

constexpr unsigned int bits_per_byte = 8;
constexpr unsigned int decimal_base  = 10;

amount_bytes to_bytes( const amount& a )
{
  std::vector< unsigned char > digits;
  boost::multiprecision::export_bits( a, std::back_inserter( digits ), bits_per_byte );

  amount_bytes bytes{};
  std::ranges::transform( digits,
                          bytes.end() - static_cast< std::ptrdiff_t >( digits.size() ),
                          []( unsigned char c )
                          {
                            return std::byte( c );
                          } );
  return bytes;
}

amount from_bytes( std::span< const std::byte > bytes )
{
  if( bytes.size() != amount_length )
    throw std::runtime_error( "amount must be exactly 32 bytes" );

  std::array< unsigned char, amount_length > digits{};
  std::ranges::transform( bytes,
                          digits.begin(),
                          []( std::byte b )
                          {
                            return std::to_integer< unsigned char >( b );
                          } );

  amount a;
  boost::multiprecision::import_bits( a, digits.begin(), digits.end(), bits_per_byte );
  return a;
}

encode::result< amount > amount_from_string( std::string_view sv ) noexcept
{
  if( sv.empty() )
    return std::unexpected( encode::encode_errc::empty_input );

  static const amount max = std::numeric_limits< amount >::max();

  amount value = 0;

  for( char c: sv )
  {
    if( c < '0' || c > '9' )
      return std::unexpected( encode::encode_errc::invalid_character );

    unsigned int digit = static_cast< unsigned int >( c - '0' );

    if( value > ( max - digit ) / decimal_base )
      return std::unexpected( encode::encode_errc::out_of_range );

    value = value * decimal_base + digit;
  }

  return value;
}

amount scale( std::uint64_t value, std::uint32_t decimals )
{
  return amount( value ) * boost::multiprecision::pow( amount( decimal_base ), decimals );
}

} // namespace mona::protocol
