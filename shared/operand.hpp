#pragma once

#include <cstdint>
#include <optional>
#include <configuration.hpp>
#include <types.hpp>

namespace traceflow
{
	// Segment and prefix state bits of an instruction (the auxiliary prefix word)
	namespace aux
	{
		constexpr uint32_t USE32 = 0x00000008;       // 32-bit code segment
		constexpr uint32_t USE64 = 0x00000010;       // 64-bit code segment
		constexpr uint32_t NATURAL_OPSIZE = 0x00000800; // operand size not overridden by 0x66
		constexpr uint32_t NATURAL_ADSIZE = 0x00001000; // address size not overridden by 0x67
	};

	// REX prefix bits
	namespace rex
	{
		constexpr uint8_t B = 0x01;
		constexpr uint8_t X = 0x02;
		constexpr uint8_t R = 0x04;
		constexpr uint8_t W = 0x08;
	};

	// Raw encoding fields of one instruction as reported by the disassembler
	struct InstructionFields {
		unsigned int mnemonic = 0; // capstone X86_INS_* id
		uint32_t aux_prefix = 0;
		uint8_t rex = 0;
	};

	// Raw encoding of the (single) ModRM memory operand of an instruction
	struct OperandFields {
		bool has_sib = false;
		uint8_t sib = 0;
		// Base register number, or the 16-bit r/m phrase (0-7) under 16-bit addressing
		uint64_t phrase = 0;
		// Displacement-only operand: no base register, phrase is meaningless
		bool no_base = false;
		// Addressed relative to the next instruction
		bool rip_relative = false;
	};

	struct EncodingFields {
		InstructionFields instruction {};
		OperandFields memory {};
	};

	struct AddressingMode {
		// RIP for rip-relative operands, std::nullopt for absolute displacements
		std::optional<Register> base {};
		std::optional<Register> index {};
		uint8_t scale = 1;
	};

	/* Operand and address size classification */

	// 16-bit addressing is in effect
	[[nodiscard]] bool ad16 ( const InstructionFields& instr ) noexcept;

	[[nodiscard]] bool op16 ( const InstructionFields& instr ) noexcept;
	[[nodiscard]] bool op32 ( const InstructionFields& instr ) noexcept;
	[[nodiscard]] bool op64 ( const InstructionFields& instr, const ArchOptions& arch ) noexcept;

	// Operand size in bytes implied by the prefixes (2, 4 or 8)
	[[nodiscard]] uint8_t operand_size ( const InstructionFields& instr, const ArchOptions& arch ) noexcept;

	[[nodiscard]] bool is_conditional_jump ( unsigned int mnemonic ) noexcept;
	[[nodiscard]] bool is_default_opsize_64 ( unsigned int mnemonic ) noexcept;

	/* Addressing mode decode */

	[[nodiscard]] uint8_t sib_base ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch ) noexcept;
	[[nodiscard]] uint8_t sib_index ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch ) noexcept;
	[[nodiscard]] uint8_t sib_scale ( const OperandFields& op ) noexcept;

	// RIP for rip-relative operands, std::nullopt when only a displacement is encoded.
	// Throws AddressDecodeError on an unknown 16-bit phrase
	[[nodiscard]] std::optional<Register> base_register ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch );

	// std::nullopt when the operand has no index register
	[[nodiscard]] std::optional<Register> index_register ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch );

	[[nodiscard]] AddressingMode decode_addressing ( const EncodingFields& fields, const ArchOptions& arch );
};
