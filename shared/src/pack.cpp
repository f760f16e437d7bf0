#include "../pack.hpp"
#include <bit>
#include <sign_extend.hpp>
#include <shared/exception.hpp>

namespace traceflow
{
	namespace
	{
		void pack_u64 ( uint64_t value, std::size_t width, Endian endian, uint8_t* out ) {
			for ( std::size_t i = 0; i < width; ++i ) {
				const auto byte = static_cast< uint8_t >( value >> ( i * 8 ) );
				out [ endian == Endian::LITTLE ? i : width - 1 - i ] = byte;
			}
		}

		uint64_t unpack_u64 ( const uint8_t* data, std::size_t width, Endian endian ) {
			uint64_t value = 0;
			for ( std::size_t i = 0; i < width; ++i ) {
				const uint64_t byte = data [ endian == Endian::LITTLE ? i : width - 1 - i ];
				value |= byte << ( i * 8 );
			}
			return value;
		}
	}

	std::vector<uint8_t> pack ( const uint128_t& value, std::size_t width, Endian endian ) {
		if ( !is_valid_pack_width ( width ) ) {
			throw InvalidWidthError ( width );
		}

		std::vector<uint8_t> buffer ( width );
		if ( width == 16 ) {
			const auto low = static_cast< uint64_t >( value & uint128_t ( 0xFFFFFFFFFFFFFFFFULL ) );
			const auto high = static_cast< uint64_t >( value >> 64 );
			if ( endian == Endian::BIG ) {
				pack_u64 ( high, 8, endian, buffer.data ( ) );
				pack_u64 ( low, 8, endian, buffer.data ( ) + 8 );
			}
			else {
				pack_u64 ( low, 8, endian, buffer.data ( ) );
				pack_u64 ( high, 8, endian, buffer.data ( ) + 8 );
			}
			return buffer;
		}

		// Truncate to the requested width
		const auto narrow = static_cast< uint64_t >( value & uint128_t ( get_mask ( width ) ) );
		pack_u64 ( narrow, width, endian, buffer.data ( ) );
		return buffer;
	}

	uint128_t unpack ( std::span<const uint8_t> buffer, Endian endian ) {
		const auto width = buffer.size ( );
		if ( !is_valid_pack_width ( width ) ) {
			throw InvalidWidthError ( width );
		}

		if ( width == 16 ) {
			const auto first = unpack_u64 ( buffer.data ( ), 8, endian );
			const auto second = unpack_u64 ( buffer.data ( ) + 8, 8, endian );
			const auto high = endian == Endian::BIG ? first : second;
			const auto low = endian == Endian::BIG ? second : first;
			return ( uint128_t ( high ) << 64 ) | uint128_t ( low );
		}

		return uint128_t ( unpack_u64 ( buffer.data ( ), width, endian ) );
	}

	int128_t unpack_signed ( std::span<const uint8_t> buffer, Endian endian ) {
		const auto value = unpack ( buffer, endian );
		const auto width = buffer.size ( );
		if ( width == 16 ) {
			if ( ( value >> 127 ) != 0 ) {
				// Magnitude of the negative value: two's complement within 128 bits
				const uint128_t magnitude = ( ~value ) + 1;
				return -int128_t ( magnitude );
			}
			return int128_t ( value );
		}
		return int128_t ( sign ( static_cast< uint64_t >( value ), width * 8 ) );
	}

	uint64_t float_to_int ( double value, int precision ) {
		switch ( precision ) {
			case 1:
				return std::bit_cast< uint32_t >( static_cast< float >( value ) );
			case 2:
				return std::bit_cast< uint64_t >( value );
			default:
				throw InvalidPrecisionError ( precision );
		}
	}

	double int_to_float ( uint64_t value, int precision ) {
		switch ( precision ) {
			case 1:
				return static_cast< double >( std::bit_cast< float >( static_cast< uint32_t >( value ) ) );
			case 2:
				return std::bit_cast< double >( value );
			default:
				throw InvalidPrecisionError ( precision );
		}
	}
};
