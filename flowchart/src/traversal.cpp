#include "../flowchart.hpp"
#include <algorithm>

using namespace traceflow;

BlockCursor::BlockCursor ( const FlowChart& chart, TraversalOrder order, std::optional<uint64_t> start, bool reverse )
	: order ( order ), reverse ( reverse ), start ( start ), found ( !start.has_value ( ) ) {
	if ( !reverse ) {
		pending.push_back ( &chart.entry ( ) );
		return;
	}

	if ( start ) {
		if ( const auto* block = chart.find_block ( *start ) ) {
			pending.push_back ( block );
		}
		return;
	}

	// Without a start address the walk begins at the last block of the function
	const auto last = std::max_element ( chart.blocks ( ).begin ( ), chart.blocks ( ).end ( ), [ ] ( const Block& a, const Block& b ) {
		return a.start ( ) < b.start ( );
	} );
	pending.push_back ( &*last );
}

void BlockCursor::schedule ( std::vector<const Block*> blocks ) {
	if ( order == TraversalOrder::DFS ) {
		pending.insert ( pending.begin ( ), blocks.begin ( ), blocks.end ( ) );
	}
	else {
		pending.insert ( pending.end ( ), blocks.begin ( ), blocks.end ( ) );
	}
}

std::optional<BlockCursor::value_type> BlockCursor::next ( ) {
	if ( reverse ) {
		if ( pending.empty ( ) ) {
			return std::nullopt;
		}
		const auto* current = pending.front ( );
		pending.pop_front ( );

		std::vector<const Block*> preds;
		for ( const auto* pred : current->predecessors ( ) ) {
			if ( pred->start ( ) < current->start ( ) ) {
				preds.push_back ( pred );
			}
		}
		std::sort ( preds.begin ( ), preds.end ( ), [ ] ( const Block* a, const Block* b ) {
			return a->start ( ) > b->start ( );
		} );
		schedule ( std::move ( preds ) );
		return current;
	}

	while ( !pending.empty ( ) ) {
		const auto* current = pending.front ( );
		pending.pop_front ( );
		if ( !visited.insert ( current->start ( ) ).second ) {
			continue;
		}

		auto succs = current->successors ( );
		std::sort ( succs.begin ( ), succs.end ( ), [ ] ( const Block* a, const Block* b ) {
			return a->start ( ) < b->start ( );
		} );
		schedule ( std::move ( succs ) );

		if ( !found ) {
			found = current->contains ( *start );
		}
		if ( found ) {
			return current;
		}
	}
	return std::nullopt;
}

HeadCursor::HeadCursor ( const FlowChart& chart, TraversalOrder order, std::optional<uint64_t> start, bool reverse )
	: chart ( &chart ), blocks ( chart, order, start, reverse ), start ( start ), reverse ( reverse ) { }

std::optional<HeadCursor::value_type> HeadCursor::next ( ) {
	while ( position >= heads.size ( ) ) {
		const auto block = blocks.next ( );
		if ( !block ) {
			return std::nullopt;
		}

		const auto& disasm = chart->disassembler ( );
		const bool from_start = start && first_block;
		first_block = false;
		if ( reverse ) {
			// Walks back from the instruction before the start address
			const uint64_t end = from_start ? *start : ( *block )->end ( );
			heads = disasm.heads ( ( *block )->start ( ), end );
			std::reverse ( heads.begin ( ), heads.end ( ) );
		}
		else {
			const uint64_t begin = from_start ? *start : ( *block )->start ( );
			heads = disasm.heads ( begin, ( *block )->end ( ) );
		}
		position = 0;
	}
	return heads [ position++ ];
}

BlockRange FlowChart::traverse_blocks ( TraversalOrder order, std::optional<uint64_t> start, bool reverse ) const {
	return BlockRange ( BlockCursor ( *this, order, start, reverse ) );
}

HeadRange FlowChart::traverse_heads ( TraversalOrder order, std::optional<uint64_t> start, bool reverse ) const {
	return HeadRange ( HeadCursor ( *this, order, start, reverse ) );
}
