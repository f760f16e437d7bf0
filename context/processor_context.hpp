#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <capstone/x86.h>
#include <configuration.hpp>
#include <types.hpp>
#include "memory.hpp"
#include "x86.hpp"

namespace traceflow
{
	// Concrete register, flag and memory state at one point of one path.
	// Plain value type: copies are independent snapshots.
	class ProcessorContext {
	public:
		ProcessorContext ( ) : ProcessorContext ( ArchOptions { } ) { }
		explicit ProcessorContext ( const ArchOptions& options );

		[[nodiscard]] const ArchOptions& arch ( ) const noexcept {
			return options;
		}

		// Address of the instruction being (or last) stepped
		[[nodiscard]] uint64_t& ip ( ) noexcept {
			return instruction_pointer;
		}
		[[nodiscard]] uint64_t ip ( ) const noexcept {
			return instruction_pointer;
		}

		[[nodiscard]] x86::Flags& rflags ( ) noexcept {
			return flags;
		}
		[[nodiscard]] const x86::Flags& rflags ( ) const noexcept {
			return flags;
		}

		// Returns the access mask for a register at a width
		[[nodiscard]] static uint64_t get_access_mask ( std::size_t size, uint8_t shift = 0 );

		// Reads the low `size` bytes (or bits 8-15 when shift is 8). Throws InvalidWidthError.
		[[nodiscard]] uint64_t get_reg ( Register reg, std::size_t size = 8, uint8_t shift = 0 ) const;
		[[nodiscard]] uint64_t get_reg ( x86_reg reg ) const;

		// 4 byte writes zero the upper half, 1 and 2 byte writes merge
		void set_reg ( Register reg, uint64_t value, std::size_t size = 8, uint8_t shift = 0 );
		void set_reg ( x86_reg reg, uint64_t value );

		// Reads `size` bytes (1, 2, 4, 8 or 16) honoring the configured byte order
		[[nodiscard]] uint128_t read_memory ( uint64_t address, std::size_t size ) const;
		void write_memory ( uint64_t address, const uint128_t& value, std::size_t size );

		[[nodiscard]] Memory& memory ( ) noexcept {
			return mem;
		}
		[[nodiscard]] const Memory& memory ( ) const noexcept {
			return mem;
		}

	private:
		ArchOptions options;
		std::array<uint64_t, Register::COUNT> registers {};
		x86::Flags flags { .value = x86::DEFAULT_RFLAGS };
		uint64_t instruction_pointer = 0;
		Memory mem;
	};

	// Emulates the instruction at the given address against the context
	using ProcessorStep = std::function<void ( ProcessorContext&, uint64_t )>;
};
