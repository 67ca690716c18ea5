#include <gtest/gtest.h>

#include <mona/encode/hex.hpp>
#include <mona/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  auto encoded_data = mona::encode::to_hex( mona::memory::as_bytes( data ) );

  EXPECT_EQ( encoded_data, valid_hex_str );
  EXPECT_EQ( mona::encode::to_hex( {} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = mona::encode::from_hex( valid_hex_str );

  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, mona::memory::as_bytes( data ) ) );

  decoded_data = mona::encode::from_hex( valid_hex_str.substr( 2 ) );
  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, mona::memory::as_bytes( data ) ) );

  decoded_data = mona::encode::from_hex( "0x04080F10172A"sv );
  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, mona::memory::as_bytes( data ) ) );

  decoded_data = mona::encode::from_hex( ""sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );

  decoded_data = mona::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), mona::encode::encode_errc::invalid_length );
    EXPECT_EQ( decoded_data.error().message(), "invalid length" );
  }

  decoded_data = mona::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), mona::encode::encode_errc::invalid_character );
    EXPECT_EQ( decoded_data.error().message(), "invalid character" );
  }
}

TEST( hex, byte_values )
{
  std::array< std::byte, 4 > bytes{ std::byte{ 0x00 }, std::byte{ 0x7f }, std::byte{ 0x80 }, std::byte{ 0xff } };

  auto str = mona::encode::to_hex( bytes );
  EXPECT_EQ( str, "0x007f80ff" );

  auto decoded = mona::encode::from_hex( "0X007F80FF"sv );
  ASSERT_TRUE( decoded );
  EXPECT_TRUE( std::ranges::equal( *decoded, bytes ) );

  decoded = mona::encode::from_hex( "0x0x"sv );
  ASSERT_FALSE( decoded );
  EXPECT_EQ( decoded.error(), mona::encode::encode_errc::invalid_character );
}
