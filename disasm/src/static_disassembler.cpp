#include "../disassembler.hpp"
#include <algorithm>
#include <shared/exception.hpp>

using namespace traceflow;

void StaticDisassembler::add_function ( uint64_t start, uint64_t end ) {
	if ( end <= start ) {
		throw TracingError ( fmt::format ( "empty function range ({:#x} :: {:#x})", start, end ) );
	}
	functions [ start ] = AddressRange { start, end };
}

void StaticDisassembler::add_block ( uint64_t function_start, BlockInfo block ) {
	auto& list = blocks [ function_start ];
	if ( block.start == function_start ) {
		list.insert ( list.begin ( ), std::move ( block ) );
	}
	else {
		list.push_back ( std::move ( block ) );
	}
}

void StaticDisassembler::add_instruction ( uint64_t address, const EncodingFields& fields ) {
	instructions [ address ] = fields;
}

std::optional<AddressRange> StaticDisassembler::function_bounds ( uint64_t address ) const {
	// Last function starting at or before the address
	auto it = functions.upper_bound ( address );
	if ( it == functions.begin ( ) ) {
		return std::nullopt;
	}
	--it;
	if ( !it->second.contains ( address ) ) {
		return std::nullopt;
	}
	return it->second;
}

std::vector<BlockInfo> StaticDisassembler::function_blocks ( uint64_t function_start ) const {
	auto it = blocks.find ( function_start );
	if ( it == blocks.end ( ) ) {
		return { };
	}
	return it->second;
}

std::vector<uint64_t> StaticDisassembler::heads ( uint64_t start, uint64_t end ) const {
	std::vector<uint64_t> result;
	for ( auto it = instructions.lower_bound ( start ); it != instructions.end ( ) && it->first < end; ++it ) {
		result.push_back ( it->first );
	}
	return result;
}

std::optional<uint64_t> StaticDisassembler::next_head ( uint64_t address, uint64_t limit ) const {
	auto it = instructions.upper_bound ( address );
	if ( it == instructions.end ( ) || it->first >= limit ) {
		return std::nullopt;
	}
	return it->first;
}

EncodingFields StaticDisassembler::encoding ( uint64_t address ) const {
	auto it = instructions.find ( address );
	if ( it == instructions.end ( ) ) {
		throw DisassemblyError ( fmt::format ( "no instruction at {:#x}", address ) );
	}
	return it->second;
}
