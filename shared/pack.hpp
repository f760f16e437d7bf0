#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include <configuration.hpp>
#include <types.hpp>

namespace traceflow
{
	// Widths accepted by pack and unpack
	[[nodiscard]] constexpr bool is_valid_pack_width ( std::size_t width ) noexcept {
		return width == 1 || width == 2 || width == 4 || width == 8 || width == 16;
	}

	// Packs the low `width` bytes of `value`. 16 byte values are written as two 8 byte halves.
	[[nodiscard]] std::vector<uint8_t> pack ( const uint128_t& value, std::size_t width, Endian endian = Endian::LITTLE );

	// Unpacks a 1, 2, 4, 8 or 16 byte buffer; the width is the buffer size
	[[nodiscard]] uint128_t unpack ( std::span<const uint8_t> buffer, Endian endian = Endian::LITTLE );

	// Same as unpack, reading the value as two's complement of the buffer width
	[[nodiscard]] int128_t unpack_signed ( std::span<const uint8_t> buffer, Endian endian = Endian::LITTLE );

	// IEEE-754 bit pattern of `value`; precision 1 is single (4 bytes), 2 is double (8 bytes)
	[[nodiscard]] uint64_t float_to_int ( double value, int precision = 2 );

	// Reverse of float_to_int
	[[nodiscard]] double int_to_float ( uint64_t value, int precision = 2 );
};
