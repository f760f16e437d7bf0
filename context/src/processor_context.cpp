#include "../processor_context.hpp"
#include <shared/exception.hpp>
#include <shared/pack.hpp>
#include <shared/registers.hpp>

using namespace traceflow;

ProcessorContext::ProcessorContext ( const ArchOptions& options ) : options ( options ) {
	registers [ RSP ] = options.stack_base;
	registers [ RBP ] = options.stack_base;
}

uint64_t ProcessorContext::get_access_mask ( std::size_t size, uint8_t shift ) {
	uint64_t mask = 0;
	switch ( size ) {
		case 1: mask = 0xFFULL; break;
		case 2: mask = 0xFFFFULL; break;
		case 4: mask = 0xFFFFFFFFULL; break;
		case 8: mask = 0xFFFFFFFFFFFFFFFFULL; break;
		default: throw InvalidWidthError ( size );
	}
	return mask << shift;
}

uint64_t ProcessorContext::get_reg ( Register reg, std::size_t size, uint8_t shift ) const {
	if ( reg == RIP ) {
		return instruction_pointer & get_access_mask ( size );
	}
	const auto mask = get_access_mask ( size, shift );
	return ( registers.at ( reg ) & mask ) >> shift;
}

uint64_t ProcessorContext::get_reg ( x86_reg reg ) const {
	const auto access = from_capstone ( reg );
	if ( !access ) {
		throw TracingError ( fmt::format ( "unsupported register id {}", static_cast< int >( reg ) ) );
	}
	return get_reg ( access->reg, access->size, access->shift );
}

void ProcessorContext::set_reg ( Register reg, uint64_t value, std::size_t size, uint8_t shift ) {
	if ( reg == RIP ) {
		instruction_pointer = value & get_access_mask ( size );
		return;
	}

	auto& full = registers.at ( reg );
	if ( size == 4 ) {
		full = value & 0xFFFFFFFFULL;
		return;
	}

	const auto mask = get_access_mask ( size, shift );
	full = ( full & ~mask ) | ( ( value << shift ) & mask );
}

void ProcessorContext::set_reg ( x86_reg reg, uint64_t value ) {
	const auto access = from_capstone ( reg );
	if ( !access ) {
		throw TracingError ( fmt::format ( "unsupported register id {}", static_cast< int >( reg ) ) );
	}
	set_reg ( access->reg, value, access->size, access->shift );
}

uint128_t ProcessorContext::read_memory ( uint64_t address, std::size_t size ) const {
	if ( !is_valid_pack_width ( size ) ) {
		throw InvalidWidthError ( size );
	}
	const auto bytes = mem.read ( address, size );
	return unpack ( bytes, options.endian ( ) );
}

void ProcessorContext::write_memory ( uint64_t address, const uint128_t& value, std::size_t size ) {
	mem.write ( address, pack ( value, size, options.endian ( ) ) );
}
