#include "../capstone_disassembler.hpp"
#include <algorithm>
#include <set>

using namespace traceflow;

CapstoneDisassembler::CapstoneDisassembler ( std::vector<uint8_t> code_bytes, uint64_t base, const ArchOptions& options )
	: options ( options ),
	code ( std::move ( code_bytes ) ),
	decoder ( code.data ( ), code.size ( ), base, capstone::mode_for_bits ( options.bits ) ),
	tables ( options ) { }

EncodingFields CapstoneDisassembler::encoding_fields ( const capstone::Instruction& instr ) const {
	EncodingFields fields;
	fields.instruction.mnemonic = instr.mnemonic ( );
	if ( !instr.has_detail ( ) ) {
		return fields;
	}

	const auto& detail = instr.detail ( );
	auto& aux_prefix = fields.instruction.aux_prefix;
	if ( options.bits == 64 ) {
		aux_prefix |= aux::USE64;
	}
	else if ( options.bits == 32 ) {
		aux_prefix |= aux::USE32;
	}
	if ( detail.prefix [ 2 ] != 0x66 ) {
		aux_prefix |= aux::NATURAL_OPSIZE;
	}
	if ( detail.prefix [ 3 ] != 0x67 ) {
		aux_prefix |= aux::NATURAL_ADSIZE;
	}
	fields.instruction.rex = detail.rex;

	const auto memory_operand = std::find_if ( detail.operands, detail.operands + detail.op_count, [ ] ( const cs_x86_op& op ) {
		return op.type == X86_OP_MEM;
	} );
	if ( memory_operand == detail.operands + detail.op_count ) {
		return fields;
	}

	const uint8_t mod = ( detail.modrm >> 6 ) & 3;
	const uint8_t rm = detail.modrm & 7;
	const bool addressing_16 = ad16 ( fields.instruction );

	auto& memory = fields.memory;
	memory.has_sib = !addressing_16 && mod != 3 && rm == 4;
	memory.sib = detail.sib;
	memory.phrase = rm;
	if ( !addressing_16 && options.is_64bit ( ) && ( detail.rex & rex::B ) ) {
		memory.phrase |= 8;
	}

	// mod 00 with r/m 101 (or a SIB base of 101) encodes no base register
	const auto base = memory_operand->mem.base;
	memory.rip_relative = base == X86_REG_RIP || base == X86_REG_EIP;
	memory.no_base = base == X86_REG_INVALID;
	return fields;
}

AddressRange CapstoneDisassembler::analyze_function ( uint64_t entry ) {
	if ( auto existing = tables.function_bounds ( entry ); existing && existing->start == entry ) {
		return *existing;
	}

	std::map<uint64_t, capstone::Instruction> decoded;
	std::set<uint64_t> leaders { entry };
	std::vector<uint64_t> worklist { entry };

	while ( !worklist.empty ( ) ) {
		uint64_t ip = worklist.back ( );
		worklist.pop_back ( );

		while ( !decoded.contains ( ip ) ) {
			auto instr = decoder.decode ( ip );
			if ( !instr.is_valid ( ) ) {
				if ( ip == entry ) {
					throw DisassemblyError ( fmt::format ( "unable to decode function entry {:#x}", entry ) );
				}
				traceflow::log::debug ( "[disasm] flow stops at undecodable {:#x}", ip );
				break;
			}

			const auto next_ip = instr.next_ip ( );
			const bool conditional = instr.is_conditional_branch ( );
			const bool stops = instr.ends_flow ( );
			if ( instr.is_jump ( ) ) {
				const auto target = instr.near_branch_target ( );
				if ( target != 0 && decoder.contains ( target ) ) {
					leaders.insert ( target );
					worklist.push_back ( target );
				}
			}
			decoded.emplace ( ip, std::move ( instr ) );

			if ( conditional ) {
				leaders.insert ( next_ip );
				worklist.push_back ( next_ip );
				break;
			}
			if ( stops ) {
				break;
			}
			ip = next_ip;
		}
	}

	std::vector<BlockInfo> blocks;
	uint64_t function_end = entry;
	for ( auto it = decoded.begin ( ); it != decoded.end ( ); ++it ) {
		const auto& [ip, instr] = *it;
		function_end = std::max ( function_end, instr.next_ip ( ) );

		const bool starts_block = blocks.empty ( )
			|| leaders.contains ( ip )
			|| blocks.back ( ).end != ip;
		if ( starts_block ) {
			blocks.push_back ( BlockInfo { ip, ip, { } } );
		}
		auto& block = blocks.back ( );
		block.end = instr.next_ip ( );

		auto next = std::next ( it );
		const bool falls_into_next = next != decoded.end ( ) && next->first == instr.next_ip ( );
		const bool block_ends = instr.is_jump ( ) || instr.ends_flow ( ) || !falls_into_next || leaders.contains ( instr.next_ip ( ) );
		if ( !block_ends ) {
			continue;
		}

		if ( instr.is_jump ( ) ) {
			const auto target = instr.near_branch_target ( );
			if ( decoded.contains ( target ) ) {
				block.successors.push_back ( target );
			}
		}
		if ( !instr.ends_flow ( ) && decoded.contains ( instr.next_ip ( ) ) ) {
			block.successors.push_back ( instr.next_ip ( ) );
		}

		// Force the next decoded instruction to open a new block
		if ( falls_into_next ) {
			leaders.insert ( instr.next_ip ( ) );
		}
	}

	tables.add_function ( entry, function_end );
	for ( auto& block : blocks ) {
		tables.add_block ( entry, std::move ( block ) );
	}
	for ( const auto& [ip, instr] : decoded ) {
		tables.add_instruction ( ip, encoding_fields ( instr ) );
	}

	traceflow::log::debug ( "[disasm] function {:#x} :: {:#x}, {} blocks, {} instructions", entry, function_end, blocks.size ( ), decoded.size ( ) );
	return AddressRange { entry, function_end };
}
