#include "../operand.hpp"
#include <sign_extend.hpp>
#include <shared/capstone++.hpp>
#include <shared/exception.hpp>

namespace traceflow
{
	namespace
	{
		constexpr uint32_t SIZE_MASK_AD = aux::USE32 | aux::USE64 | aux::NATURAL_ADSIZE;
		constexpr uint32_t SIZE_MASK_OP = aux::USE32 | aux::USE64 | aux::NATURAL_OPSIZE;

		[[nodiscard]] bool rex_w ( const InstructionFields& instr ) noexcept {
			return ( instr.rex & rex::W ) != 0;
		}
	}

	bool ad16 ( const InstructionFields& instr ) noexcept {
		const auto p = instr.aux_prefix & SIZE_MASK_AD;
		return p == aux::NATURAL_ADSIZE || p == aux::USE32;
	}

	bool op16 ( const InstructionFields& instr ) noexcept {
		const auto p = instr.aux_prefix & SIZE_MASK_OP;
		return p == aux::NATURAL_OPSIZE
			|| p == aux::USE32
			|| ( p == aux::USE64 && !rex_w ( instr ) );
	}

	bool op32 ( const InstructionFields& instr ) noexcept {
		const auto p = instr.aux_prefix & SIZE_MASK_OP;
		return p == 0
			|| p == ( aux::USE32 | aux::NATURAL_OPSIZE )
			|| ( p == ( aux::USE64 | aux::NATURAL_OPSIZE ) && !rex_w ( instr ) );
	}

	bool op64 ( const InstructionFields& instr, const ArchOptions& arch ) noexcept {
		if ( !arch.is_64bit ( ) ) {
			return false;
		}

		return ( instr.aux_prefix & aux::USE64 ) != 0
			&& ( rex_w ( instr ) || ( ( instr.aux_prefix & aux::NATURAL_OPSIZE ) != 0 && is_default_opsize_64 ( instr.mnemonic ) ) );
	}

	uint8_t operand_size ( const InstructionFields& instr, const ArchOptions& arch ) noexcept {
		if ( op64 ( instr, arch ) ) {
			return 8;
		}
		if ( op16 ( instr ) ) {
			return 2;
		}
		return 4;
	}

	bool is_conditional_jump ( unsigned int mnemonic ) noexcept {
		return test_instruction_bit ( jcc_bits, mnemonic );
	}

	bool is_default_opsize_64 ( unsigned int mnemonic ) noexcept {
		return test_instruction_bit ( default_opsize_64_bits, mnemonic );
	}

	uint8_t sib_base ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch ) noexcept {
		uint8_t base = op.sib & 7;
		if ( arch.is_64bit ( ) && ( instr.rex & rex::B ) ) {
			base |= 8;
		}
		return base;
	}

	uint8_t sib_index ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch ) noexcept {
		uint8_t index = ( op.sib >> 3 ) & 7;
		if ( arch.is_64bit ( ) && ( instr.rex & rex::X ) ) {
			index |= 8;
		}
		return index;
	}

	uint8_t sib_scale ( const OperandFields& op ) noexcept {
		return static_cast< uint8_t >( 1 << ( ( op.sib >> 6 ) & 3 ) );
	}

	std::optional<Register> base_register ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch ) {
		if ( op.rip_relative ) {
			return RIP;
		}
		if ( op.no_base ) {
			return std::nullopt;
		}
		if ( op.has_sib ) {
			return static_cast< Register >( sib_base ( instr, op, arch ) );
		}

		if ( !ad16 ( instr ) ) {
			if ( op.phrase >= Register::COUNT ) {
				throw AddressDecodeError ( fmt::format ( "invalid base register number {:#x}", op.phrase ) );
			}
			return static_cast< Register >( op.phrase );
		}

		// A phrase of all ones stands for the stack pointer
		if ( sign ( op.phrase, arch.bits ) == -1 ) {
			return RSP;
		}

		switch ( op.phrase ) {
			case 0: // [BX+SI]
			case 1: // [BX+DI]
			case 7: // [BX]
				return RBX;
			case 2: // [BP+SI]
			case 3: // [BP+DI]
			case 6: // [BP]
				return RBP;
			case 4: // [SI]
				return RSI;
			case 5: // [DI]
				return RDI;
			default:
				throw AddressDecodeError ( fmt::format ( "unable to parse x86 base register from phrase {:#x}", op.phrase ) );
		}
	}

	std::optional<Register> index_register ( const InstructionFields& instr, const OperandFields& op, const ArchOptions& arch ) {
		if ( op.has_sib ) {
			const auto index = sib_index ( instr, op, arch );
			// 100b without REX.X means no index
			if ( index == 4 ) {
				return std::nullopt;
			}
			return static_cast< Register >( index );
		}

		if ( !ad16 ( instr ) ) {
			return std::nullopt;
		}

		switch ( op.phrase ) {
			case 0: // [BX+SI]
			case 2: // [BP+SI]
				return RSI;
			case 1: // [BX+DI]
			case 3: // [BP+DI]
				return RDI;
			case 4: // [SI]
			case 5: // [DI]
			case 6: // [BP]
			case 7: // [BX]
				return std::nullopt;
			default:
				throw AddressDecodeError ( fmt::format ( "unable to parse x86 index register from phrase {:#x}", op.phrase ) );
		}
	}

	AddressingMode decode_addressing ( const EncodingFields& fields, const ArchOptions& arch ) {
		AddressingMode mode;
		mode.base = base_register ( fields.instruction, fields.memory, arch );
		mode.index = index_register ( fields.instruction, fields.memory, arch );
		mode.scale = fields.memory.has_sib ? sib_scale ( fields.memory ) : 1;
		return mode;
	}
};
