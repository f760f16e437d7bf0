#include "../flowchart.hpp"
#include <algorithm>
#include <unordered_map>
#include <shared/exception.hpp>
#include <shared/log.hpp>

using namespace traceflow;

FlowChart::FlowChart ( const Disassembler& disassembler, uint64_t address, ProcessorStep step )
	: disasm ( disassembler ), step ( std::move ( step ) ) {
	const auto function = disasm.function_bounds ( address );
	if ( !function ) {
		throw InvalidFunctionError ( address );
	}
	function_bounds = *function;

	const auto infos = disasm.function_blocks ( function_bounds.start );
	if ( infos.empty ( ) ) {
		throw InvalidFunctionError ( address );
	}

	// Block pointers are taken below, so the list must not reallocate afterwards
	block_list.reserve ( infos.size ( ) );
	std::unordered_map<uint64_t, std::size_t> index_of;
	for ( const auto& info : infos ) {
		if ( !index_of.emplace ( info.start, block_list.size ( ) ).second ) {
			throw TracingError ( fmt::format ( "duplicate block start {:#x} in function {:#x}", info.start, function_bounds.start ) );
		}
		block_list.emplace_back ( info.start, info.end, block_list.size ( ) );
	}

	for ( std::size_t i = 0; i < infos.size ( ); ++i ) {
		auto& block = block_list [ i ];
		for ( const auto successor : infos [ i ].successors ) {
			auto it = index_of.find ( successor );
			if ( it == index_of.end ( ) ) {
				log::debug ( "edge {:#x} -> {:#x} leaves function {:#x}", block.start ( ), successor, function_bounds.start );
				continue;
			}
			auto& target = block_list [ it->second ];
			block.successors_.push_back ( &target );
			target.predecessors_.push_back ( &block );
		}
	}

	by_start.resize ( block_list.size ( ) );
	for ( std::size_t i = 0; i < by_start.size ( ); ++i ) {
		by_start [ i ] = i;
	}
	std::sort ( by_start.begin ( ), by_start.end ( ), [ this ] ( std::size_t a, std::size_t b ) {
		return block_list [ a ].start ( ) < block_list [ b ].start ( );
	} );

	log::debug ( "flowchart {:#x} :: {:#x} with {} blocks", function_bounds.start, function_bounds.end, block_list.size ( ) );
}

const Block* FlowChart::find_block ( uint64_t address ) const {
	// First block starting after the address, then step back to the candidate
	auto it = std::upper_bound ( by_start.begin ( ), by_start.end ( ), address, [ this ] ( uint64_t value, std::size_t index ) {
		return value < block_list [ index ].start ( );
	} );
	if ( it == by_start.begin ( ) ) {
		return nullptr;
	}
	const auto& block = block_list [ *std::prev ( it ) ];
	return block.contains ( address ) ? &block : nullptr;
}

PathRange FlowChart::get_paths ( uint64_t address ) {
	return PathRange ( PathCursor ( *this, find_block ( address ) ) );
}

FlowChart::PathGenerator& FlowChart::generator ( const Block& block ) {
	auto [it, inserted] = generators.try_emplace ( block.start ( ) );
	auto& state = it->second;
	if ( inserted ) {
		// The entry block and blocks nothing flows into start their paths.
		// Predecessors at or after the block are loop edges and never parents.
		const bool is_entry = block.index ( ) == 0;
		state.root_pending = is_entry || block.predecessors ( ).empty ( );
		if ( !is_entry ) {
			for ( const auto* pred : block.predecessors ( ) ) {
				if ( pred->start ( ) < block.start ( ) ) {
					state.parents.push_back ( pred );
				}
			}
		}
	}
	return state;
}

std::size_t FlowChart::add_node ( const Block& block, std::optional<std::size_t> parent ) {
	const auto index = nodes.size ( );
	nodes.push_back ( PathNode { &block, parent, std::nullopt, 0 } );
	path_cache [ block.start ( ) ].push_back ( index );
	return index;
}

bool FlowChart::advance_paths ( const Block& block ) {
	auto& state = generator ( block );
	if ( state.exhausted ) {
		return false;
	}

	if ( state.root_pending ) {
		state.root_pending = false;
		add_node ( block, std::nullopt );
		return true;
	}

	while ( state.parent_position < state.parents.size ( ) ) {
		const auto* parent = state.parents [ state.parent_position ];
		// Parent paths already cached are used first, then the parent's own enumeration is extended
		const bool available = state.parent_path_position < path_cache [ parent->start ( ) ].size ( ) || advance_paths ( *parent );
		if ( available ) {
			const auto parent_node = path_cache [ parent->start ( ) ] [ state.parent_path_position++ ];
			add_node ( block, parent_node );
			return true;
		}
		++state.parent_position;
		state.parent_path_position = 0;
	}

	state.exhausted = true;
	log::debug ( "all {} paths to block {:#x} enumerated", path_cache [ block.start ( ) ].size ( ), block.start ( ) );
	return false;
}

void FlowChart::paths_to ( uint64_t address, const std::function<bool ( const std::vector<const Block*>& )>& callback ) const {
	if ( !function_bounds.contains ( address ) ) {
		throw AddressOutOfRangeError ( address, function_bounds.start, function_bounds.end );
	}

	std::unordered_set<uint64_t> visited;
	std::vector<const Block*> current_path;
	walk_paths ( address, entry ( ), visited, current_path, callback );
}

bool FlowChart::walk_paths ( uint64_t address, const Block& current, std::unordered_set<uint64_t>& visited,
	std::vector<const Block*>& current_path, const std::function<bool ( const std::vector<const Block*>& )>& callback ) const {
	visited.insert ( current.start ( ) );
	current_path.push_back ( &current );

	bool keep_going = true;
	if ( current.contains ( address ) ) {
		keep_going = callback ( current_path );
	}

	for ( auto it = current.successors ( ).begin ( ); keep_going && it != current.successors ( ).end ( ); ++it ) {
		if ( visited.contains ( ( *it )->start ( ) ) ) {
			continue;
		}
		keep_going = walk_paths ( address, **it, visited, current_path, callback );
	}

	// Leave the block available to the remaining walks
	current_path.pop_back ( );
	visited.erase ( current.start ( ) );
	return keep_going;
}
