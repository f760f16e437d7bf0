#pragma once

#include <cstdint>

namespace traceflow::x86
{
	// RFLAGS Register (64 bits)
	union Flags {
		std::uint64_t value;
		struct {
			std::uint64_t CF : 1;					// Carry Flag
			std::uint64_t reserved1 : 1;		// Reserved (always 1)
			std::uint64_t PF : 1;					// Parity Flag
			std::uint64_t reserved3 : 1;		// Reserved (0)
			std::uint64_t AF : 1;					// Auxiliary Carry Flag
			std::uint64_t reserved5 : 1;		// Reserved (0)
			std::uint64_t ZF : 1;					// Zero Flag
			std::uint64_t SF : 1;					// Sign Flag
			std::uint64_t TF : 1;					// Trap Flag
			std::uint64_t IF : 1;					// Interrupt Enable Flag
			std::uint64_t DF : 1;					// Direction Flag
			std::uint64_t OF : 1;					// Overflow Flag
			std::uint64_t IOPL : 2;				// I/O Privilege Level
			std::uint64_t NT : 1;					// Nested Task Flag
			std::uint64_t reserved15 : 1;  // Reserved (0)
			std::uint64_t RF : 1;					// Resume Flag
			std::uint64_t VM : 1;					// Virtual-8086 Mode
			std::uint64_t AC : 1;					// Alignment Check / Access Control
			std::uint64_t VIF : 1;					// Virtual Interrupt Flag
			std::uint64_t VIP : 1;					// Virtual Interrupt Pending
			std::uint64_t ID : 1;					// ID Flag
			std::uint64_t reserved22_63 : 41;  // Reserved (0)
		};
	};

	// Power-on value: IF and the always-one reserved bit
	static constexpr std::uint64_t DEFAULT_RFLAGS = 0x0000000000000202ULL;
};
