// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>

#include <mona/encode/error.hpp>
#include <mona/protocol/account.hpp>
#include <mona/protocol/amount.hpp>

using namespace std::string_view_literals;

constexpr auto max_amount_str = "115792089237316195423570985008687907853269984665640564039457584007913129639935"sv;

TEST( amount, bytes )
{
  auto zero = mona::protocol::to_bytes( 0 );
  EXPECT_TRUE( std::ranges::all_of( zero,
                                    []( std::byte b )
                                    {
                                      return b == std::byte{ 0x00 };
                                    } ) );

  auto one = mona::protocol::to_bytes( 1 );
  EXPECT_EQ( one.back(), std::byte{ 0x01 } );
  EXPECT_EQ( one.front(), std::byte{ 0x00 } );

  mona::protocol::amount value = 0x0102;
  auto bytes                   = mona::protocol::to_bytes( value );
  EXPECT_EQ( bytes[ 30 ], std::byte{ 0x01 } );
  EXPECT_EQ( bytes[ 31 ], std::byte{ 0x02 } );
  EXPECT_EQ( mona::protocol::from_bytes( bytes ), value );

  auto max   = std::numeric_limits< mona::protocol::amount >::max();
  auto max_b = mona::protocol::to_bytes( max );
  EXPECT_TRUE( std::ranges::all_of( max_b,
                                    []( std::byte b )
                                    {
                                      return b == std::byte{ 0xff };
                                    } ) );
  EXPECT_EQ( mona::protocol::from_bytes( max_b ), max );

  std::vector< std::byte > short_bytes( 31 );
  EXPECT_THROW( mona::protocol::from_bytes( short_bytes ), std::runtime_error );
}

TEST( amount, from_string )
{
  auto value = mona::protocol::amount_from_string( "500" );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 500 );

  value = mona::protocol::amount_from_string( max_amount_str );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, std::numeric_limits< mona::protocol::amount >::max() );

  value = mona::protocol::amount_from_string(
    "115792089237316195423570985008687907853269984665640564039457584007913129639936"sv );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), mona::encode::encode_errc::out_of_range );
  EXPECT_EQ( value.error().message(), "value out of range" );

  value = mona::protocol::amount_from_string( "12a" );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), mona::encode::encode_errc::invalid_character );

  value = mona::protocol::amount_from_string( "" );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), mona::encode::encode_errc::empty_input );
}

TEST( amount, scale )
{
  EXPECT_EQ( mona::protocol::scale( 0, 18 ), 0 );
  EXPECT_EQ( mona::protocol::scale( 7, 0 ), 7 );
  EXPECT_EQ( mona::protocol::scale( 100'000, 18 ).str(), "100000000000000000000000" );
  EXPECT_EQ( mona::protocol::scale( 500, 18 ), *mona::protocol::amount_from_string( "500000000000000000000" ) );
}

TEST( account, hex )
{
  auto alice = mona::protocol::system_account( "alice" );
  EXPECT_EQ( alice[ 0 ], std::byte{ 'a' } );
  EXPECT_EQ( alice[ 4 ], std::byte{ 'e' } );
  EXPECT_EQ( alice[ 5 ], std::byte{ 0x00 } );
  EXPECT_FALSE( mona::protocol::is_null( alice ) );
  EXPECT_TRUE( mona::protocol::is_null( mona::protocol::null_account ) );

  auto str = mona::protocol::to_hex( alice );
  EXPECT_EQ( str, "0x616c696365000000000000000000000000000000" );

  auto parsed = mona::protocol::account_from_hex( str );
  ASSERT_TRUE( parsed );
  EXPECT_EQ( *parsed, alice );

  parsed = mona::protocol::account_from_hex( "0x616c6963" );
  ASSERT_FALSE( parsed );
  EXPECT_EQ( parsed.error(), mona::encode::encode_errc::invalid_length );

  parsed = mona::protocol::account_from_hex( "0xzz6c696365000000000000000000000000000000" );
  ASSERT_FALSE( parsed );
  EXPECT_EQ( parsed.error(), mona::encode::encode_errc::invalid_character );

  auto long_account = mona::protocol::system_account( "an account name longer than twenty bytes" );
  EXPECT_EQ( long_account[ 19 ], std::byte{ 'g' } );
}

// NOLINTEND
