#pragma once

#include <cstdint>
#include <string> // Added for std::string
#include <utility>
#include <array>
#include <capstone/capstone.h>
#include <capstone/x86.h>
#include <fmt/format.h>
#include <shared/exception.hpp>
#include <shared/log.hpp>

using InstructionBits = std::array<uint8_t, ( X86_INS_ENDING + 7 ) / 8>;

constexpr void set_instruction_bit ( InstructionBits& bits, unsigned int mnemonic_id ) {
	if ( mnemonic_id < X86_INS_ENDING ) { // Basic bounds check
		bits [ mnemonic_id / 8 ] |= ( 1 << ( mnemonic_id % 8 ) );
	}
}

[[nodiscard]] constexpr bool test_instruction_bit ( const InstructionBits& bits, unsigned int mnemonic_id ) noexcept {
	return mnemonic_id < X86_INS_ENDING && ( bits [ mnemonic_id / 8 ] & ( 1 << ( mnemonic_id % 8 ) ) ) != 0;
}

// The Jcc family
constexpr InstructionBits create_jcc_bitfield ( ) {
	InstructionBits bits = {};
	set_instruction_bit ( bits, X86_INS_JB );
	set_instruction_bit ( bits, X86_INS_JAE );
	set_instruction_bit ( bits, X86_INS_JBE );
	set_instruction_bit ( bits, X86_INS_JA );
	set_instruction_bit ( bits, X86_INS_JE );
	set_instruction_bit ( bits, X86_INS_JNE );
	set_instruction_bit ( bits, X86_INS_JL );
	set_instruction_bit ( bits, X86_INS_JGE );
	set_instruction_bit ( bits, X86_INS_JLE );
	set_instruction_bit ( bits, X86_INS_JG );
	set_instruction_bit ( bits, X86_INS_JO );
	set_instruction_bit ( bits, X86_INS_JNO );
	set_instruction_bit ( bits, X86_INS_JP );
	set_instruction_bit ( bits, X86_INS_JNP );
	set_instruction_bit ( bits, X86_INS_JS );
	set_instruction_bit ( bits, X86_INS_JNS );
	return bits;
}

// Jcc plus the counter based branches, everything that may or may not be taken
constexpr InstructionBits create_conditional_branch_bitfield ( ) {
	InstructionBits bits = create_jcc_bitfield ( );
	set_instruction_bit ( bits, X86_INS_JCXZ );
	set_instruction_bit ( bits, X86_INS_JECXZ );
	set_instruction_bit ( bits, X86_INS_JRCXZ );
	set_instruction_bit ( bits, X86_INS_LOOP );
	set_instruction_bit ( bits, X86_INS_LOOPE );
	set_instruction_bit ( bits, X86_INS_LOOPNE );
	return bits;
}

// Instructions whose operand size defaults to 64 bits in long mode (stack and near branch users)
constexpr InstructionBits create_default_opsize_64_bitfield ( ) {
	InstructionBits bits = create_conditional_branch_bitfield ( );
	set_instruction_bit ( bits, X86_INS_POP );
	set_instruction_bit ( bits, X86_INS_POPF );
	set_instruction_bit ( bits, X86_INS_POPFQ );
	set_instruction_bit ( bits, X86_INS_PUSH );
	set_instruction_bit ( bits, X86_INS_PUSHF );
	set_instruction_bit ( bits, X86_INS_PUSHFQ );
	set_instruction_bit ( bits, X86_INS_RET );
	set_instruction_bit ( bits, X86_INS_RETF );
	set_instruction_bit ( bits, X86_INS_RETFQ );
	set_instruction_bit ( bits, X86_INS_CALL );
	set_instruction_bit ( bits, X86_INS_LCALL );
	set_instruction_bit ( bits, X86_INS_ENTER );
	set_instruction_bit ( bits, X86_INS_LEAVE );
	set_instruction_bit ( bits, X86_INS_JMP );
	return bits;
}

static constexpr auto jcc_bits = create_jcc_bitfield ( );
static constexpr auto conditional_branch_bits = create_conditional_branch_bitfield ( );
static constexpr auto default_opsize_64_bits = create_default_opsize_64_bitfield ( );

namespace capstone
{
	[[nodiscard]] constexpr cs_mode mode_for_bits ( uint8_t bits ) noexcept {
		switch ( bits ) {
			case 16: return CS_MODE_16;
			case 32: return CS_MODE_32;
			default: return CS_MODE_64;
		}
	}

	class Instruction {
	public:
		Instruction ( ) noexcept = default;

		explicit Instruction ( const cs_insn* insn, uint64_t ip ) noexcept
			: ip_ ( ip ) {
			if ( insn && insn->id != X86_INS_INVALID && insn->size > 0 ) {
				valid_ = true;
				id_ = insn->id;
				size_ = static_cast< uint8_t >( insn->size );

				mnemonic_str_ = insn->mnemonic;
				op_str_ = insn->op_str;

				if ( insn->detail ) {
					x86_detail_copy_ = insn->detail->x86;
					detail_copied_ = true;
				}
			}
		}

		Instruction ( Instruction&& other ) noexcept = default;
		Instruction& operator=( Instruction&& other ) noexcept = default;
		Instruction ( const Instruction& other ) = default;
		Instruction& operator=( const Instruction& other ) = default;
		~Instruction ( ) = default;

		// --- Accessors ---
		[[nodiscard]] inline uint64_t ip ( ) const noexcept {
			return ip_;
		}
		[[nodiscard]] inline uint64_t next_ip ( ) const noexcept {
			return ip_ + size_;
		}
		[[nodiscard]] inline uint8_t length ( ) const noexcept {
			return size_;
		}
		[[nodiscard]] inline bool is_valid ( ) const noexcept {
			return valid_;
		}
		[[nodiscard]] inline unsigned int mnemonic ( ) const noexcept {
			return id_;
		}
		[[nodiscard]] inline bool has_detail ( ) const noexcept {
			return detail_copied_;
		}
		[[nodiscard]] inline const cs_x86& detail ( ) const noexcept {
			return x86_detail_copy_;
		}

		// --- String Conversion ---
		[[nodiscard]] std::string to_string ( ) const {
			if ( !valid_ ) {
				// Use the stored IP even if invalid, maybe helps debugging
				return fmt::format ( "0x{:016x}: invalid instruction", ip_ );
			}
			return fmt::format ( "0x{:016x}: {} {}", ip_, mnemonic_str_, op_str_ );
		}

		// --- Classification Methods ---
		[[nodiscard]] inline bool is_call ( ) const noexcept {
			return valid_ && ( id_ == X86_INS_CALL || id_ == X86_INS_LCALL );
		}
		[[nodiscard]] inline bool is_conditional_branch ( ) const noexcept {
			return valid_ && test_instruction_bit ( conditional_branch_bits, id_ );
		}
		[[nodiscard]] inline bool is_unconditional_branch ( ) const noexcept {
			return valid_ && ( id_ == X86_INS_JMP || id_ == X86_INS_LJMP );
		}
		[[nodiscard]] inline bool is_jump ( ) const noexcept {
			return is_conditional_branch ( ) || is_unconditional_branch ( );
		}
		[[nodiscard]] inline bool is_return ( ) const noexcept {
			return valid_ && ( id_ == X86_INS_RET || id_ == X86_INS_RETF || id_ == X86_INS_RETFQ ||
												 id_ == X86_INS_IRET || id_ == X86_INS_IRETD || id_ == X86_INS_IRETQ );
		}
		[[nodiscard]] inline bool is_halt ( ) const noexcept {
			return valid_ && id_ == X86_INS_HLT;
		}
		// Control never falls through to the next instruction
		[[nodiscard]] inline bool ends_flow ( ) const noexcept {
			return !valid_ || is_return ( ) || is_halt ( ) || is_unconditional_branch ( );
		}

		// --- Target Resolution ---

		/**
		 * @brief For immediate branches/calls, returns the immediate value (target address).
		 * @return Target address or 0 if not an immediate branch/call or details unavailable.
		 */
		[[nodiscard]] uint64_t near_branch_target ( ) const noexcept {
			if ( !valid_ || !detail_copied_ || !( is_jump ( ) || is_call ( ) ) || x86_detail_copy_.op_count == 0 ) {
				return 0;
			}
			const auto& op = x86_detail_copy_.operands [ 0 ];
			if ( op.type == X86_OP_IMM ) {
				return static_cast< uint64_t >( op.imm );
			}
			return 0;
		}

	private:
		uint64_t ip_ = 0;
		unsigned int id_ = X86_INS_INVALID;
		uint8_t size_ = 0;
		bool valid_ = false;
		bool detail_copied_ = false;
		std::string mnemonic_str_; // Store strings to avoid lifetime issues
		std::string op_str_;
		cs_x86 x86_detail_copy_ = {}; // Store the detail struct content
	};


	// --- Decoder Class ---
	class Decoder {
	public:
		Decoder ( const uint8_t* data, size_t size, uint64_t base_addr, cs_mode mode )
			: data_ ( data ), base_addr_ ( base_addr ), size_ ( size ) {
			auto result = cs_open ( CS_ARCH_X86, mode, &handle_ );
			if ( result != CS_ERR_OK ) {
				traceflow::log::error ( "[engine - capstone] Failed to initialize decoder {}", static_cast< int >( result ) );
				handle_ = 0;
				throw traceflow::DisassemblyError ( fmt::format ( "cs_open failed: {}", cs_strerror ( result ) ) );
			}
			cs_option ( handle_, CS_OPT_DETAIL, CS_OPT_ON );
		}

		// Rule of 5 for Decoder (handle needs careful management)
		Decoder ( const Decoder& ) = delete; // Disallow copying
		Decoder& operator=( const Decoder& ) = delete;

		Decoder ( Decoder&& other ) noexcept
			: handle_ ( std::exchange ( other.handle_, 0 ) ), // Transfer ownership
			data_ ( other.data_ ),
			base_addr_ ( other.base_addr_ ),
			size_ ( other.size_ ) { }

		Decoder& operator=( Decoder&& other ) noexcept {
			if ( this != &other ) {
				if ( handle_ ) {
					cs_close ( &handle_ );
				}
				handle_ = std::exchange ( other.handle_, 0 );
				data_ = other.data_;
				base_addr_ = other.base_addr_;
				size_ = other.size_;
			}
			return *this;
		}

		~Decoder ( ) noexcept {
			if ( handle_ ) {
				cs_close ( &handle_ );
			}
		}

		[[nodiscard]] bool contains ( uint64_t ip ) const noexcept {
			return ip >= base_addr_ && ( ip - base_addr_ ) < size_;
		}

		[[nodiscard]] const csh& get_handle ( ) const noexcept {
			return handle_;
		}

		// Decodes one instruction at `ip`; returns an invalid instruction outside the buffer or on failure
		[[nodiscard]] Instruction decode ( uint64_t ip ) const {
			if ( !handle_ || !contains ( ip ) ) [[unlikely]] {
				return Instruction ( );
			}

			const uint8_t* current_ptr = data_ + ( ip - base_addr_ );
			size_t code_size = size_ - ( ip - base_addr_ );
			uint64_t address = ip;

			// cs_malloc is required by cs_disasm_iter documentation
			cs_insn* insn = cs_malloc ( handle_ );
			if ( !insn ) {
				traceflow::log::error ( "[engine - capstone] cs_malloc failed" );
				return Instruction ( );
			}

			Instruction result;
			if ( cs_disasm_iter ( handle_, &current_ptr, &code_size, &address, insn ) ) [[likely]] {
				result = Instruction ( insn, ip );
			}
			else {
				traceflow::log::debug ( "[engine - capstone] failed to decode at {:#x}", ip );
			}
			cs_free ( insn, 1 );
			return result;
		}

	private:
		csh handle_ = 0;
		const uint8_t* data_ = nullptr;
		uint64_t base_addr_ = 0;
		size_t size_ = 0;
	};
}
