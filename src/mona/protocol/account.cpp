#include <mona/protocol/account.hpp>

#include <algorithm>

#include <mona/encode/hex.hpp>
#include <mona/memory.hpp>

namespace mona::protocol {

bool is_null( const account& a ) noexcept
{
  return a == null_account;
}

std::string to_hex( const account& a ) noexcept
{
  return encode::to_hex( memory::as_bytes( a ) );
}

encode::result< account > account_from_hex( std::string_view sv ) noexcept
{
  return encode::from_hex( sv ).and_then(
    []( auto&& bytes ) -> encode::result< account >
    {
      if( bytes.size() != account_length )
        return std::unexpected( encode::encode_errc::invalid_length );

      account a{};
      std::ranges::copy( bytes, a.begin() );
      return a;
    } );
}

} // namespace mona::protocol
