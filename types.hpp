#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>

namespace mp = boost::multiprecision;
using int128_t = mp::int128_t;
using uint128_t = mp::uint128_t;

namespace traceflow
{
	// General-purpose registers in hardware encoding order (ModRM/SIB numbering)
	enum Register : uint8_t {
		RAX,
		RCX,
		RDX,
		RBX,
		RSP,
		RBP,
		RSI,
		RDI,
		R8,
		R9,
		R10,
		R11,
		R12,
		R13,
		R14,
		R15,
		RIP,

		COUNT // Total count for array sizing
	};

	// Half-open address range [start, end)
	struct AddressRange {
		uint64_t start = 0;
		uint64_t end = 0;

		[[nodiscard]] constexpr bool contains ( uint64_t address ) const noexcept {
			return start <= address && address < end;
		}
	};
};
