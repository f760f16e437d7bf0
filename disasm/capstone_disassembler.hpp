#pragma once

#include <cstdint>
#include <map>
#include <vector>
#include <shared/capstone++.hpp>
#include "disassembler.hpp"

namespace traceflow
{
	/**
	 * @brief Disassembler over a flat code buffer.
	 * Functions are discovered by recursive descent from entry points given to analyze_function.
	 */
	class CapstoneDisassembler : public Disassembler {
	public:
		CapstoneDisassembler ( std::vector<uint8_t> code, uint64_t base, const ArchOptions& options = { } );

		CapstoneDisassembler ( const CapstoneDisassembler& ) = delete;
		CapstoneDisassembler& operator=( const CapstoneDisassembler& ) = delete;

		// Discovers the function at `entry` and registers its blocks. Throws DisassemblyError.
		AddressRange analyze_function ( uint64_t entry );

		[[nodiscard]] std::optional<AddressRange> function_bounds ( uint64_t address ) const override {
			return tables.function_bounds ( address );
		}
		[[nodiscard]] std::vector<BlockInfo> function_blocks ( uint64_t function_start ) const override {
			return tables.function_blocks ( function_start );
		}
		[[nodiscard]] std::vector<uint64_t> heads ( uint64_t start, uint64_t end ) const override {
			return tables.heads ( start, end );
		}
		[[nodiscard]] std::optional<uint64_t> next_head ( uint64_t address, uint64_t limit ) const override {
			return tables.next_head ( address, limit );
		}
		[[nodiscard]] EncodingFields encoding ( uint64_t address ) const override {
			return tables.encoding ( address );
		}
		[[nodiscard]] const ArchOptions& arch ( ) const noexcept override {
			return options;
		}

		// Decoded instruction at `address`, invalid if nothing decodes there
		[[nodiscard]] capstone::Instruction instruction ( uint64_t address ) const {
			return decoder.decode ( address );
		}

		// Prefix, REX and ModRM/SIB fields of a decoded instruction
		[[nodiscard]] EncodingFields encoding_fields ( const capstone::Instruction& instr ) const;

	private:
		ArchOptions options;
		std::vector<uint8_t> code;
		capstone::Decoder decoder;
		StaticDisassembler tables;
	};
};
