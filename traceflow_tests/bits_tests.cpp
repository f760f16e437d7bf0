#include "utils.hpp"
#include <array>
#include <cmath>
#include <sign_extend.hpp>
#include <shared/pack.hpp>

using namespace traceflow;

TEST_CASE ( sign_interprets_high_bit ) {
	CHECK ( sign ( 0xFF, 8 ) == -1 );
	CHECK ( sign ( 0x7F, 8 ) == 0x7F );
	CHECK ( sign ( 0x8000, 16 ) == -0x8000 );
	CHECK ( sign ( 0xFFFFFFFFFFFFFFFFULL, 64 ) == -1 );
	CHECK ( sign ( 0x1234, 32 ) == 0x1234 );
	// Bits above the width are kept
	CHECK ( sign ( 0x1FF, 8 ) == 0xFF );
	CHECK ( sign ( 0x17F, 8 ) == 0x17F );
	CHECK_THROWS ( sign ( 1, 0 ), InvalidWidthError );
}

TEST_CASE ( sign_extend_widths ) {
	CHECK_EQ ( sign_extend ( 0x80, 1, 2 ), 0xFF80ULL );
	CHECK_EQ ( sign_extend ( 0x7F, 1, 8 ), 0x7FULL );
	CHECK_EQ ( sign_extend ( 0x8000, 2, 4 ), 0xFFFF8000ULL );
	CHECK_EQ ( sign_extend ( 0x80000000, 4, 8 ), 0xFFFFFFFF80000000ULL );
	// Bits above the source width are dropped
	CHECK_EQ ( sign_extend ( 0x1234, 1, 4 ), 0x34ULL );
	CHECK_THROWS ( sign_extend ( 0, 9, 8 ), InvalidWidthError );

	for ( uint64_t v = 0; v <= 0xFF; ++v ) {
		CHECK_EQ ( sign_extend ( sign_extend ( v, 1, 2 ), 2, 4 ), sign_extend ( v, 1, 4 ) );
	}
}

TEST_CASE ( masks_and_widths ) {
	CHECK_EQ ( get_mask ( 1 ), 0xFFULL );
	CHECK_EQ ( get_mask ( 4 ), 0xFFFFFFFFULL );
	CHECK_EQ ( get_mask ( 8 ), 0xFFFFFFFFFFFFFFFFULL );
	CHECK_THROWS ( get_mask ( 16 ), InvalidWidthError );

	CHECK_EQ ( sign_bit ( 0x80, 1 ), 1 );
	CHECK_EQ ( sign_bit ( 0x80, 2 ), 0 );

	CHECK_EQ ( get_byte_width ( 0 ), 1u );
	CHECK_EQ ( get_byte_width ( 0x100 ), 2u );
	CHECK_EQ ( get_byte_width ( 0x10000 ), 4u );
	CHECK_EQ ( get_byte_width ( 0x100000000ULL ), 8u );

	CHECK_EQ ( align_page_up ( 0x1001 ), 0x2000ULL );
	CHECK_EQ ( align_page_up ( 0x2000 ), 0x2000ULL );
}

TEST_CASE ( pack_byte_order ) {
	const auto little = pack ( 0x1234, 2 );
	CHECK ( little == ( std::vector<uint8_t> { 0x34, 0x12 } ) );
	const std::array<uint8_t, 2> raw = { 0x34, 0x12 };
	CHECK ( unpack ( raw ) == 0x1234 );

	const auto big = pack ( 0x11223344, 4, Endian::BIG );
	CHECK ( big == ( std::vector<uint8_t> { 0x11, 0x22, 0x33, 0x44 } ) );
	CHECK ( unpack ( big, Endian::BIG ) == 0x11223344 );

	// Values wider than the width are truncated
	CHECK ( pack ( 0x1FF, 1 ) == ( std::vector<uint8_t> { 0xFF } ) );

	CHECK_THROWS ( pack ( 1, 3 ), InvalidWidthError );
	const std::array<uint8_t, 3> odd = { 1, 2, 3 };
	CHECK_THROWS ( unpack ( odd ), InvalidWidthError );
}

TEST_CASE ( pack_sixteen_bytes ) {
	const uint128_t value = ( uint128_t ( 0x0011223344556677ULL ) << 64 ) | uint128_t ( 0x8899AABBCCDDEEFFULL );

	const auto little = pack ( value, 16 );
	CHECK ( little.size ( ) == 16 );
	CHECK ( little.front ( ) == 0xFF );
	CHECK ( little.back ( ) == 0x00 );
	CHECK ( unpack ( little ) == value );

	const auto big = pack ( value, 16, Endian::BIG );
	CHECK ( big.front ( ) == 0x00 );
	CHECK ( big [ 8 ] == 0x88 );
	CHECK ( big.back ( ) == 0xFF );
	CHECK ( unpack ( big, Endian::BIG ) == value );

	for ( const std::size_t width : { 1, 2, 4, 8 } ) {
		const uint64_t v = 0x0102030405060708ULL & get_mask ( width );
		CHECK ( unpack ( pack ( v, width ) ) == v );
		CHECK ( unpack ( pack ( v, width, Endian::BIG ), Endian::BIG ) == v );
	}
}

TEST_CASE ( unpack_signed_values ) {
	const std::array<uint8_t, 1> minus_one = { 0xFF };
	CHECK ( unpack_signed ( minus_one ) == -1 );
	const std::array<uint8_t, 2> positive = { 0x00, 0x7F };
	CHECK ( unpack_signed ( positive, Endian::BIG ) == 0x7F );

	const auto wide = pack ( ~uint128_t ( 0 ), 16 );
	CHECK ( unpack_signed ( wide ) == -1 );
}

TEST_CASE ( float_bit_patterns ) {
	CHECK_EQ ( float_to_int ( 1.5, 1 ), 0x3FC00000ULL );
	CHECK_EQ ( float_to_int ( 1.5 ), 0x3FF8000000000000ULL );
	CHECK ( int_to_float ( 0x3FC00000, 1 ) == 1.5 );
	CHECK ( int_to_float ( 0x3FF8000000000000ULL, 2 ) == 1.5 );
	CHECK ( int_to_float ( float_to_int ( -123.25, 1 ), 1 ) == -123.25 );
	CHECK ( int_to_float ( float_to_int ( 3.141592653589793, 2 ), 2 ) == 3.141592653589793 );
	CHECK ( std::isinf ( int_to_float ( 0x7F800000, 1 ) ) );

	CHECK_THROWS ( float_to_int ( 1.0, 3 ), InvalidPrecisionError );
	CHECK_THROWS ( int_to_float ( 0, 0 ), InvalidPrecisionError );
}
