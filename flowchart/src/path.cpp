#include "../flowchart.hpp"
#include <algorithm>
#include <shared/exception.hpp>
#include <shared/log.hpp>

using namespace traceflow;

PathNode& Path::get_node ( ) const {
	return chart->nodes.at ( node );
}

const Block& Path::block ( ) const {
	return *get_node ( ).block;
}

std::optional<Path> Path::parent ( ) const {
	const auto& parent_node = get_node ( ).parent;
	if ( !parent_node ) {
		return std::nullopt;
	}
	return Path ( *chart, *parent_node );
}

bool Path::contains ( uint64_t address ) const {
	return block ( ).contains ( address );
}

std::optional<uint64_t> Path::fill_point ( ) const {
	const auto& current = get_node ( );
	if ( !current.context ) {
		return std::nullopt;
	}
	return current.fill;
}

ProcessorContext Path::context ( std::optional<uint64_t> address ) const {
	auto& current = get_node ( );
	const auto& bb = *current.block;
	if ( address && !bb.contains ( *address ) ) {
		throw AddressOutOfRangeError ( *address, bb.start ( ), bb.end ( ) );
	}

	const auto& disasm = chart->disassembler ( );

	// Filled through the instruction at `address`, or the whole block
	uint64_t end = bb.end ( );
	if ( address ) {
		end = disasm.next_head ( *address, bb.end ( ) ).value_or ( bb.end ( ) );
	}

	if ( current.context && current.fill == end ) {
		return *current.context;
	}

	// Replayed state can not be rewound, start over from the parent's final state
	if ( !current.context || current.fill > end ) {
		if ( current.context ) {
			log::debug ( "rewinding context of block {:#x} from {:#x} to {:#x}", bb.start ( ), current.fill, end );
		}
		if ( current.parent ) {
			current.context = Path ( *chart, *current.parent ).context ( );
		}
		else {
			current.context = ProcessorContext ( disasm.arch ( ) );
		}
		current.fill = bb.start ( );
	}

	const auto heads = disasm.heads ( current.fill, end );
	for ( std::size_t i = 0; i < heads.size ( ); ++i ) {
		const auto head = heads [ i ];
		if ( chart->step ) {
			// Stepped on a copy so a failing step leaves the cached state untouched
			auto working = *current.context;
			working.ip ( ) = head;
			chart->step ( working, head );
			*current.context = std::move ( working );
		}
		else {
			current.context->ip ( ) = head;
		}
		current.fill = i + 1 < heads.size ( ) ? heads [ i + 1 ] : end;
	}
	current.fill = end;

	return *current.context;
}

std::vector<const Block*> Path::blocks ( ) const {
	std::vector<const Block*> result;
	std::optional<Path> cursor = *this;
	while ( cursor ) {
		result.push_back ( &cursor->block ( ) );
		cursor = cursor->parent ( );
	}
	std::reverse ( result.begin ( ), result.end ( ) );
	return result;
}

std::size_t Path::length ( ) const {
	std::size_t count = 0;
	for ( std::optional<std::size_t> current = node; current; current = chart->nodes.at ( *current ).parent ) {
		++count;
	}
	return count;
}

std::optional<PathCursor::value_type> PathCursor::next ( ) {
	if ( !block ) {
		return std::nullopt;
	}

	// Paths found earlier come first, then the enumeration for the block is resumed
	const auto& cached = chart->path_cache [ block->start ( ) ];
	if ( position < cached.size ( ) || chart->advance_paths ( *block ) ) {
		const auto index = chart->path_cache [ block->start ( ) ] [ position++ ];
		return Path ( *chart, index );
	}
	return std::nullopt;
}
