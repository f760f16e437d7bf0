#include "utils.hpp"
#include <set>
#include <disasm/capstone_disassembler.hpp>
#include <flowchart/flowchart.hpp>
#include <shared/exception.hpp>

using namespace traceflow;

namespace
{
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
	const std::vector<uint8_t> diamond_fn = {
		0x31, 0xC0, 0x85, 0xC9, 0x74, 0x07, 0xB8, 0x01, 0x00, 0x00, 0x00, 0xEB, 0x05,
		0xB8, 0x02, 0x00, 0x00, 0x00, 0x83, 0xC0, 0x10, 0xC3
	};

	constexpr uint64_t base = 0x401000;

	// mov/add/xor with register or immediate sources
	ProcessorStep make_step ( const CapstoneDisassembler& disasm ) {
		return [ &disasm ] ( ProcessorContext& ctx, uint64_t ip ) {
			const auto instr = disasm.instruction ( ip );
			const auto& detail = instr.detail ( );
			if ( detail.op_count != 2 || detail.operands [ 0 ].type != X86_OP_REG ) {
				return;
			}
			const auto dest = detail.operands [ 0 ].reg;
			const auto& source = detail.operands [ 1 ];
			const uint64_t value = source.type == X86_OP_IMM ? static_cast< uint64_t >( source.imm ) : ctx.get_reg ( source.reg );
			switch ( instr.mnemonic ( ) ) {
				case X86_INS_MOV: ctx.set_reg ( dest, value ); break;
				case X86_INS_ADD: ctx.set_reg ( dest, ctx.get_reg ( dest ) + value ); break;
				case X86_INS_XOR: ctx.set_reg ( dest, ctx.get_reg ( dest ) ^ value ); break;
				default: break;
			}
		};
	}
}

TEST_CASE ( capstone_discovers_blocks ) {
	CapstoneDisassembler disasm ( diamond_fn, base );
	const auto bounds = disasm.analyze_function ( base );
	CHECK_EQ ( bounds.start, base );
	CHECK_EQ ( bounds.end, base + 0x16 );

	const auto blocks = disasm.function_blocks ( base );
	CHECK_EQ ( blocks.size ( ), 4u );
	CHECK_EQ ( blocks [ 0 ].start, base );
	CHECK_EQ ( blocks [ 0 ].end, base + 0x6 );
	CHECK ( std::set<uint64_t> ( blocks [ 0 ].successors.begin ( ), blocks [ 0 ].successors.end ( ) ) == ( std::set<uint64_t> { base + 0x6, base + 0xd } ) );
	CHECK_EQ ( blocks [ 1 ].start, base + 0x6 );
	CHECK_EQ ( blocks [ 1 ].end, base + 0xd );
	CHECK ( blocks [ 1 ].successors == ( std::vector<uint64_t> { base + 0x12 } ) );
	CHECK_EQ ( blocks [ 2 ].start, base + 0xd );
	CHECK ( blocks [ 2 ].successors == ( std::vector<uint64_t> { base + 0x12 } ) );
	CHECK_EQ ( blocks [ 3 ].start, base + 0x12 );
	CHECK_EQ ( blocks [ 3 ].end, base + 0x16 );
	CHECK ( blocks [ 3 ].successors.empty ( ) );

	CHECK ( disasm.heads ( base, base + 0x16 ) == ( std::vector<uint64_t> { base, base + 0x2, base + 0x4, base + 0x6, base + 0xb, base + 0xd, base + 0x12, base + 0x15 } ) );
	CHECK ( disasm.next_head ( base + 0x12, base + 0x16 ) == base + 0x15 );
	CHECK ( disasm.encoding ( base + 0x4 ).instruction.mnemonic == X86_INS_JE );
	CHECK ( is_conditional_jump ( disasm.encoding ( base + 0x4 ).instruction.mnemonic ) );
}

TEST_CASE ( capstone_rejects_bad_entry ) {
	CapstoneDisassembler disasm ( diamond_fn, base );
	CHECK_THROWS ( disasm.analyze_function ( base + 0x100 ), DisassemblyError );
	CHECK ( !disasm.function_bounds ( base + 0x100 ).has_value ( ) );
}

TEST_CASE ( capstone_paths_carry_state ) {
	CapstoneDisassembler disasm ( diamond_fn, base );
	disasm.analyze_function ( base );
	FlowChart chart ( disasm, base + 0x15, make_step ( disasm ) );
	CHECK_EQ ( chart.size ( ), 4u );

	std::set<uint64_t> results;
	for ( const auto& path : chart.get_paths ( base + 0x15 ) ) {
		const auto ctx = path.context ( base + 0x12 );
		results.insert ( ctx.get_reg ( RAX, 4 ) );
	}
	CHECK ( results == ( std::set<uint64_t> { 0x11, 0x12 } ) );
}

TEST_CASE ( capstone_encoding_fields ) {
	// mov rax, [r12+r13*8] ; mov ax, [rsp] ; mov eax, [rbx]
	const std::vector<uint8_t> code = { 0x4B, 0x8B, 0x04, 0xEC, 0x66, 0x8B, 0x04, 0x24, 0x8B, 0x03 };
	CapstoneDisassembler disasm ( code, 0x1000 );
	const auto& arch = disasm.arch ( );

	const auto wide = disasm.encoding_fields ( disasm.instruction ( 0x1000 ) );
	CHECK ( wide.memory.has_sib );
	CHECK ( op64 ( wide.instruction, arch ) );
	const auto wide_mode = decode_addressing ( wide, arch );
	CHECK ( wide_mode.base == R12 );
	CHECK ( wide_mode.index == R13 );
	CHECK_EQ ( wide_mode.scale, 8 );

	const auto word = disasm.encoding_fields ( disasm.instruction ( 0x1004 ) );
	CHECK ( op16 ( word.instruction ) );
	CHECK_EQ ( operand_size ( word.instruction, arch ), 2 );
	const auto word_mode = decode_addressing ( word, arch );
	CHECK ( word_mode.base == RSP );
	CHECK ( !word_mode.index.has_value ( ) );

	const auto plain = disasm.encoding_fields ( disasm.instruction ( 0x1008 ) );
	CHECK ( !plain.memory.has_sib );
	CHECK ( decode_addressing ( plain, arch ).base == RBX );
	CHECK_EQ ( operand_size ( plain.instruction, arch ), 4 );
}

TEST_CASE ( capstone_encoding_fields_16bit ) {
	// mov ax, [bx+si] ; mov ax, [bp+di]
	ArchOptions options { };
	options.bits = 16;
	const std::vector<uint8_t> code = { 0x8B, 0x00, 0x8B, 0x03 };
	CapstoneDisassembler disasm ( code, 0x100, options );

	const auto first = disasm.encoding_fields ( disasm.instruction ( 0x100 ) );
	CHECK ( ad16 ( first.instruction ) );
	CHECK ( op16 ( first.instruction ) );
	const auto first_mode = decode_addressing ( first, options );
	CHECK ( first_mode.base == RBX );
	CHECK ( first_mode.index == RSI );

	const auto second_mode = decode_addressing ( disasm.encoding_fields ( disasm.instruction ( 0x102 ) ), options );
	CHECK ( second_mode.base == RBP );
	CHECK ( second_mode.index == RDI );
}

TEST_CASE ( capstone_encoding_fields_without_base ) {
	// mov rax, [rip+0x10] ; mov eax, [rcx*4+0x10] ; mov eax, [rbp+0x10]
	const std::vector<uint8_t> code = {
		0x48, 0x8B, 0x05, 0x10, 0x00, 0x00, 0x00,
		0x8B, 0x04, 0x8D, 0x10, 0x00, 0x00, 0x00,
		0x8B, 0x45, 0x10
	};
	CapstoneDisassembler disasm ( code, 0x1000 );
	const auto& arch = disasm.arch ( );

	const auto relative = disasm.encoding_fields ( disasm.instruction ( 0x1000 ) );
	CHECK ( relative.memory.rip_relative );
	const auto relative_mode = decode_addressing ( relative, arch );
	CHECK ( relative_mode.base == RIP );
	CHECK ( !relative_mode.index.has_value ( ) );

	const auto scaled = disasm.encoding_fields ( disasm.instruction ( 0x1007 ) );
	CHECK ( scaled.memory.has_sib );
	CHECK ( scaled.memory.no_base );
	const auto scaled_mode = decode_addressing ( scaled, arch );
	CHECK ( !scaled_mode.base.has_value ( ) );
	CHECK ( scaled_mode.index == RCX );
	CHECK_EQ ( scaled_mode.scale, 4 );

	// A real rbp base is still reported
	const auto framed = disasm.encoding_fields ( disasm.instruction ( 0x100e ) );
	CHECK ( !framed.memory.no_base );
	CHECK ( decode_addressing ( framed, arch ).base == RBP );
}

TEST_CASE ( capstone_encoding_fields_16bit_displacement ) {
	// mov ax, [0x1234]
	ArchOptions options { };
	options.bits = 16;
	const std::vector<uint8_t> code = { 0x8B, 0x06, 0x34, 0x12 };
	CapstoneDisassembler disasm ( code, 0x100, options );

	const auto fields = disasm.encoding_fields ( disasm.instruction ( 0x100 ) );
	CHECK ( fields.memory.no_base );
	const auto mode = decode_addressing ( fields, options );
	CHECK ( !mode.base.has_value ( ) );
	CHECK ( !mode.index.has_value ( ) );
}
