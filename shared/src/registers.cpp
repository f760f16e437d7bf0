#include "../registers.hpp"
#include <array>
#include <shared/exception.hpp>

namespace traceflow
{
	namespace
	{
		constexpr std::size_t REGISTER_TOTAL = static_cast< std::size_t >( Register::COUNT );

		// Rows: 1, 2, 4, 8 bytes
		constexpr std::array<std::array<std::string_view, REGISTER_TOTAL>, 4> register_names = { {
			{ "al", "cl", "dl", "bl", "spl", "bpl", "sil", "dil", "r8b", "r9b", "r10b", "r11b", "r12b", "r13b", "r14b", "r15b", "" },
			{ "ax", "cx", "dx", "bx", "sp", "bp", "si", "di", "r8w", "r9w", "r10w", "r11w", "r12w", "r13w", "r14w", "r15w", "ip" },
			{ "eax", "ecx", "edx", "ebx", "esp", "ebp", "esi", "edi", "r8d", "r9d", "r10d", "r11d", "r12d", "r13d", "r14d", "r15d", "eip" },
			{ "rax", "rcx", "rdx", "rbx", "rsp", "rbp", "rsi", "rdi", "r8", "r9", "r10", "r11", "r12", "r13", "r14", "r15", "rip" },
		} };

		constexpr std::array<std::array<x86_reg, REGISTER_TOTAL>, 4> capstone_registers = { {
			{ X86_REG_AL, X86_REG_CL, X86_REG_DL, X86_REG_BL, X86_REG_SPL, X86_REG_BPL, X86_REG_SIL, X86_REG_DIL,
				X86_REG_R8B, X86_REG_R9B, X86_REG_R10B, X86_REG_R11B, X86_REG_R12B, X86_REG_R13B, X86_REG_R14B, X86_REG_R15B, X86_REG_INVALID },
			{ X86_REG_AX, X86_REG_CX, X86_REG_DX, X86_REG_BX, X86_REG_SP, X86_REG_BP, X86_REG_SI, X86_REG_DI,
				X86_REG_R8W, X86_REG_R9W, X86_REG_R10W, X86_REG_R11W, X86_REG_R12W, X86_REG_R13W, X86_REG_R14W, X86_REG_R15W, X86_REG_IP },
			{ X86_REG_EAX, X86_REG_ECX, X86_REG_EDX, X86_REG_EBX, X86_REG_ESP, X86_REG_EBP, X86_REG_ESI, X86_REG_EDI,
				X86_REG_R8D, X86_REG_R9D, X86_REG_R10D, X86_REG_R11D, X86_REG_R12D, X86_REG_R13D, X86_REG_R14D, X86_REG_R15D, X86_REG_EIP },
			{ X86_REG_RAX, X86_REG_RCX, X86_REG_RDX, X86_REG_RBX, X86_REG_RSP, X86_REG_RBP, X86_REG_RSI, X86_REG_RDI,
				X86_REG_R8, X86_REG_R9, X86_REG_R10, X86_REG_R11, X86_REG_R12, X86_REG_R13, X86_REG_R14, X86_REG_R15, X86_REG_RIP },
		} };

		[[nodiscard]] std::size_t width_row ( std::size_t width ) {
			switch ( width ) {
				case 1: return 0;
				case 2: return 1;
				case 4: return 2;
				case 8: return 3;
				default: throw InvalidWidthError ( width );
			}
		}
	}

	std::string_view register_name ( Register reg, std::size_t width ) {
		const auto name = register_names [ width_row ( width ) ].at ( reg );
		if ( name.empty ( ) ) {
			throw InvalidWidthError ( width );
		}
		return name;
	}

	x86_reg to_capstone ( Register reg, std::size_t width ) {
		const auto id = capstone_registers [ width_row ( width ) ].at ( reg );
		if ( id == X86_REG_INVALID ) {
			throw InvalidWidthError ( width );
		}
		return id;
	}

	std::optional<RegisterAccess> from_capstone ( x86_reg reg ) noexcept {
		switch ( reg ) {
			case X86_REG_AH: return RegisterAccess { RAX, 1, 8 };
			case X86_REG_CH: return RegisterAccess { RCX, 1, 8 };
			case X86_REG_DH: return RegisterAccess { RDX, 1, 8 };
			case X86_REG_BH: return RegisterAccess { RBX, 1, 8 };
			case X86_REG_INVALID: return std::nullopt;
			default: break;
		}

		constexpr std::array<uint8_t, 4> widths = { 1, 2, 4, 8 };
		for ( std::size_t row = 0; row < widths.size ( ); ++row ) {
			for ( std::size_t i = 0; i < REGISTER_TOTAL; ++i ) {
				if ( capstone_registers [ row ] [ i ] == reg ) {
					return RegisterAccess { static_cast< Register >( i ), widths [ row ], 0 };
				}
			}
		}
		return std::nullopt;
	}
};
