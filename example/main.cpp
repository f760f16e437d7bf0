#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <disasm/capstone_disassembler.hpp>
#include <flowchart/flowchart.hpp>
#include <shared/exception.hpp>
#include <shared/log.hpp>
#include <shared/registers.hpp>

/*
0x00: 31 c0             xor    eax,eax
0x02: 85 c9             test   ecx,ecx
0x04: 74 07             je     0x0d
0x06: b8 01 00 00 00    mov    eax,0x1
0x0b: eb 05             jmp    0x12
0x0d: b8 02 00 00 00    mov    eax,0x2
0x12: 83 c0 10          add    eax,0x10
0x15: c3                ret
*/
const uint8_t sample_fn [ ] = {
	0x31, 0xC0, 0x85, 0xC9, 0x74, 0x07, 0xB8, 0x01, 0x00, 0x00, 0x00, 0xEB, 0x05,
	0xB8, 0x02, 0x00, 0x00, 0x00, 0x83, 0xC0, 0x10, 0xC3
};

namespace
{
	std::vector<uint8_t> read_file ( const std::string& filename ) {
		std::ifstream file ( filename, std::ios::binary );
		if ( !file.is_open ( ) ) {
			throw traceflow::TracingError ( fmt::format ( "could not open file {}", filename ) );
		}
		return std::vector<uint8_t> ( std::istreambuf_iterator<char> ( file ), std::istreambuf_iterator<char> ( ) );
	}

	uint64_t parse_number ( const char* text ) {
		return std::strtoull ( text, nullptr, 0 );
	}

	// Handles the handful of data movement and arithmetic instructions the sample needs
	traceflow::ProcessorStep make_step ( const traceflow::CapstoneDisassembler& disasm ) {
		return [ &disasm ] ( traceflow::ProcessorContext& ctx, uint64_t ip ) {
			const auto instr = disasm.instruction ( ip );
			if ( !instr.is_valid ( ) || !instr.has_detail ( ) ) {
				throw traceflow::DisassemblyError ( fmt::format ( "cannot decode {:#x}", ip ) );
			}
			traceflow::log::debug ( "{}", instr.to_string ( ) );

			const auto& detail = instr.detail ( );
			if ( detail.op_count != 2 || detail.operands [ 0 ].type != X86_OP_REG ) {
				return;
			}
			const auto dest = detail.operands [ 0 ].reg;
			const auto& source = detail.operands [ 1 ];
			uint64_t value = 0;
			if ( source.type == X86_OP_IMM ) {
				value = static_cast< uint64_t >( source.imm );
			}
			else if ( source.type == X86_OP_REG ) {
				value = ctx.get_reg ( source.reg );
			}
			else {
				return;
			}

			switch ( instr.mnemonic ( ) ) {
				case X86_INS_MOV: ctx.set_reg ( dest, value ); break;
				case X86_INS_ADD: ctx.set_reg ( dest, ctx.get_reg ( dest ) + value ); break;
				case X86_INS_SUB: ctx.set_reg ( dest, ctx.get_reg ( dest ) - value ); break;
				case X86_INS_XOR: ctx.set_reg ( dest, ctx.get_reg ( dest ) ^ value ); break;
				case X86_INS_AND: ctx.set_reg ( dest, ctx.get_reg ( dest ) & value ); break;
				case X86_INS_OR: ctx.set_reg ( dest, ctx.get_reg ( dest ) | value ); break;
				default: break;
			}
		};
	}
}

// usage: traceflow_example [file base entry address [bits]]
int main ( int argc, char** argv ) {
	traceflow::log::info ( "Initializing TRACEFLOW - example" );

	std::vector<uint8_t> code ( std::begin ( sample_fn ), std::end ( sample_fn ) );
	uint64_t base = 0x401000;
	uint64_t entry = base;
	uint64_t address = base + 0x15;
	traceflow::ArchOptions options { };

	try {
		if ( argc >= 5 ) {
			code = read_file ( argv [ 1 ] );
			base = parse_number ( argv [ 2 ] );
			entry = parse_number ( argv [ 3 ] );
			address = parse_number ( argv [ 4 ] );
			if ( argc >= 6 ) {
				options.bits = static_cast< uint8_t >( parse_number ( argv [ 5 ] ) );
			}
		}
		if ( const char* verbose = std::getenv ( "TRACEFLOW_VERBOSE" ); verbose && *verbose == '1' ) {
			options.verbose = 1;
		}
		traceflow::log::set_verbose ( options.verbose );

		traceflow::CapstoneDisassembler disasm ( std::move ( code ), base, options );
		const auto bounds = disasm.analyze_function ( entry );
		traceflow::log::info ( "Function {:#x} :: {:#x}", bounds.start, bounds.end );

		traceflow::FlowChart chart ( disasm, address, make_step ( disasm ) );
		for ( const auto* block : chart.dfs_iter_blocks ( ) ) {
			traceflow::log::info ( "{} successors={}", block->to_string ( ), block->successors ( ).size ( ) );
		}

		// Bound consumption, path counts grow exponentially with branching
		constexpr std::size_t max_paths = 32;
		std::size_t count = 0;
		for ( const auto& path : chart.get_paths ( address ) ) {
			if ( count++ == max_paths ) {
				break;
			}
			std::string chain;
			for ( const auto* block : path.blocks ( ) ) {
				chain += fmt::format ( "{}{:#x}", chain.empty ( ) ? "" : " -> ", block->start ( ) );
			}
			const auto ctx = path.context ( address );
			traceflow::log::info ( "Path {}: {}", count, chain );
			traceflow::log::info ( "  {} = {:#x}", traceflow::register_name ( traceflow::RAX, 4 ), ctx.get_reg ( traceflow::RAX, 4 ) );
		}
		traceflow::log::info ( "{} path nodes built", chart.path_count ( ) );
	}
	catch ( const traceflow::TracingError& e ) {
		traceflow::log::error ( "{}", e.what ( ) );
		return 1;
	}
	return 0;
}
