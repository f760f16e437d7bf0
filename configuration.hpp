#pragma once

#include <cstdint>

namespace traceflow
{
	enum class Endian : uint8_t {
		LITTLE = 0,
		BIG
	};

	struct ArchOptions {
		// Address width of the analysed code: 16, 32 or 64
		uint8_t bits = 64;
		uint8_t big_endian : 1 = 0;
		uint8_t verbose : 1 = 0;
		uint8_t reserved : 6 = 0;
		// Initial RSP/RBP of a fresh processor context
		uint64_t stack_base = 0x0000000000F00000ULL;

		[[nodiscard]] constexpr bool is_64bit ( ) const noexcept {
			return bits == 64;
		}

		[[nodiscard]] constexpr bool is_32bit ( ) const noexcept {
			return bits == 32;
		}

		[[nodiscard]] constexpr Endian endian ( ) const noexcept {
			return big_endian ? Endian::BIG : Endian::LITTLE;
		}
	};
};
