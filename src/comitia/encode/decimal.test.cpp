#include <gtest/gtest.h>

#include <limits>

#include <comitia/encode/decimal.hpp>

TEST( decimal, encode )
{
  EXPECT_EQ( comitia::encode::to_decimal( 0 ), "0" );
  EXPECT_EQ( comitia::encode::to_decimal( 260'500 ), "260500" );
  EXPECT_EQ( comitia::encode::to_decimal( std::numeric_limits< std::uint64_t >::max() ), "18446744073709551615" );
}

TEST( decimal, decode )
{
  auto value = comitia::encode::from_decimal< std::uint32_t >( "4294967295" );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, std::numeric_limits< std::uint32_t >::max() );

  value = comitia::encode::from_decimal< std::uint32_t >( "4294967296" );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), comitia::encode::encode_errc::out_of_range );

  value = comitia::encode::from_decimal< std::uint32_t >( "" );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), comitia::encode::encode_errc::invalid_length );

  for( auto text: { "-1", "+1", "1a", " 1", "0x10" } )
  {
    value = comitia::encode::from_decimal< std::uint32_t >( text );
    ASSERT_FALSE( value ) << text;
    EXPECT_EQ( value.error(), comitia::encode::encode_errc::invalid_character );
  }

  auto small = comitia::encode::from_decimal< std::uint8_t >( "255" );
  ASSERT_TRUE( small );
  EXPECT_EQ( *small, 255 );
  EXPECT_FALSE( comitia::encode::from_decimal< std::uint8_t >( "256" ) );
}
