#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include <configuration.hpp>
#include <types.hpp>
#include <shared/operand.hpp>

namespace traceflow
{
	// One basic block as reported by a disassembler
	struct BlockInfo {
		uint64_t start = 0;
		uint64_t end = 0;
		// Start addresses of the blocks control may flow to
		std::vector<uint64_t> successors {};
	};

	// Static view of a binary: functions, their block graphs and instruction encodings
	class Disassembler {
	public:
		virtual ~Disassembler ( ) = default;

		// Bounds of the function containing `address`, if any
		[[nodiscard]] virtual std::optional<AddressRange> function_bounds ( uint64_t address ) const = 0;

		// Blocks of the function starting at `function_start`, entry block first
		[[nodiscard]] virtual std::vector<BlockInfo> function_blocks ( uint64_t function_start ) const = 0;

		// Instruction addresses in [start, end), ascending
		[[nodiscard]] virtual std::vector<uint64_t> heads ( uint64_t start, uint64_t end ) const = 0;

		// Encoding of the instruction at `address`. Throws DisassemblyError if there is none.
		[[nodiscard]] virtual EncodingFields encoding ( uint64_t address ) const = 0;

		[[nodiscard]] virtual const ArchOptions& arch ( ) const noexcept = 0;

		// First instruction address after `address` and before `limit`
		[[nodiscard]] virtual std::optional<uint64_t> next_head ( uint64_t address, uint64_t limit ) const {
			if ( address + 1 >= limit ) {
				return std::nullopt;
			}
			const auto found = heads ( address + 1, limit );
			if ( found.empty ( ) ) {
				return std::nullopt;
			}
			return found.front ( );
		}
	};

	// Disassembler backed by tables filled in by the host
	class StaticDisassembler : public Disassembler {
	public:
		explicit StaticDisassembler ( const ArchOptions& options = { } ) : options ( options ) { }

		void add_function ( uint64_t start, uint64_t end );

		// The block at the function start is reported first regardless of insertion order
		void add_block ( uint64_t function_start, BlockInfo block );

		void add_instruction ( uint64_t address, const EncodingFields& fields = { } );

		[[nodiscard]] std::optional<AddressRange> function_bounds ( uint64_t address ) const override;
		[[nodiscard]] std::vector<BlockInfo> function_blocks ( uint64_t function_start ) const override;
		[[nodiscard]] std::vector<uint64_t> heads ( uint64_t start, uint64_t end ) const override;
		[[nodiscard]] std::optional<uint64_t> next_head ( uint64_t address, uint64_t limit ) const override;
		[[nodiscard]] EncodingFields encoding ( uint64_t address ) const override;

		[[nodiscard]] const ArchOptions& arch ( ) const noexcept override {
			return options;
		}

		[[nodiscard]] std::size_t instruction_count ( ) const noexcept {
			return instructions.size ( );
		}

	private:
		ArchOptions options;
		// Keyed by function start
		std::map<uint64_t, AddressRange> functions;
		std::map<uint64_t, std::vector<BlockInfo>> blocks;
		std::map<uint64_t, EncodingFields> instructions;
	};
};
