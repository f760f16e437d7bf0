#pragma once

#include <cstddef>
#include <cstdint>
#include <shared/exception.hpp>

namespace traceflow
{
	// Mask covering `size` bytes; get_mask ( 8 ) is all ones
	[[nodiscard]] constexpr uint64_t get_mask ( std::size_t size ) {
		if ( size > 8 ) {
			throw InvalidWidthError ( size );
		}
		return size == 8 ? ~0ULL : ( 1ULL << ( size * 8 ) ) - 1;
	}

	// `value - 2^bit_width` when bit `bit_width - 1` is set, otherwise `value`.
	// Bits above `bit_width` are not masked off.
	[[nodiscard]] constexpr int64_t sign ( uint64_t value, std::size_t bit_width ) {
		if ( bit_width == 0 || bit_width > 64 ) {
			throw InvalidWidthError ( bit_width );
		}
		if ( ( ( value >> ( bit_width - 1 ) ) & 1 ) == 0 ) {
			return static_cast< int64_t >( value );
		}
		if ( bit_width == 64 ) {
			return static_cast< int64_t >( value );
		}
		return static_cast< int64_t >( value - ( 1ULL << bit_width ) );
	}

	// Highest bit of a `width` byte value
	[[nodiscard]] constexpr uint8_t sign_bit ( uint64_t value, std::size_t width ) {
		if ( width == 0 || width > 8 ) {
			throw InvalidWidthError ( width );
		}
		return static_cast< uint8_t >( ( value >> ( 8 * width - 1 ) ) & 1 );
	}

	[[nodiscard]] constexpr uint64_t sign_extend ( uint64_t value, std::size_t from_size, std::size_t to_size ) {
		if ( from_size == 0 || from_size > 8 ) {
			throw InvalidWidthError ( from_size );
		}
		if ( to_size == 0 || to_size > 8 ) {
			throw InvalidWidthError ( to_size );
		}

		const auto from_mask = get_mask ( from_size );
		const auto to_mask = get_mask ( to_size );
		const auto masked = value & from_mask;
		if ( sign_bit ( masked, from_size ) ) {
			return ( masked | ~from_mask ) & to_mask;
		}
		return masked & to_mask;
	}

	// Smallest of 1, 2, 4 or 8 bytes able to hold `value`
	[[nodiscard]] constexpr std::size_t get_byte_width ( uint64_t value ) noexcept {
		if ( value <= 0xFF ) {
			return 1;
		}
		if ( value <= 0xFFFF ) {
			return 2;
		}
		if ( value <= 0xFFFFFFFF ) {
			return 4;
		}
		return 8;
	}

	[[nodiscard]] constexpr uint64_t align_page_up ( uint64_t value ) noexcept {
		return ( value + 0x1000 - 1 ) & ~( 0x1000ULL - 1 );
	}
};
