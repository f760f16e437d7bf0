#include "utils.hpp"
#include <flowchart/flowchart.hpp>
#include <shared/exception.hpp>
#include <shared/log.hpp>

using namespace traceflow;

namespace
{
	std::vector<uint64_t> starts ( const BlockRange& range ) {
		std::vector<uint64_t> result;
		for ( const auto* block : range ) {
			result.push_back ( block->start ( ) );
		}
		return result;
	}

	std::vector<uint64_t> collect ( const HeadRange& range ) {
		std::vector<uint64_t> result;
		for ( const auto head : range ) {
			result.push_back ( head );
		}
		return result;
	}
}

TEST_CASE ( flowchart_block_model ) {
	StaticDisassembler disasm;
	tests::add_diamond ( disasm );
	FlowChart chart ( disasm, 0x100b );

	CHECK_EQ ( chart.size ( ), 4u );
	CHECK_EQ ( chart.entry ( ).start ( ), 0x1000u );
	CHECK_EQ ( chart.bounds ( ).end, 0x1016u );

	const auto& d = chart [ 3 ];
	CHECK_EQ ( d.start ( ), 0x1012u );
	CHECK_EQ ( d.predecessors ( ).size ( ), 2u );
	CHECK ( d.successors ( ).empty ( ) );
	CHECK_EQ ( chart.entry ( ).successors ( ).size ( ), 2u );

	CHECK ( chart [ 1 ] == Block ( 0x1006, 0, 7 ) );
	CHECK ( std::hash<Block> { } ( chart [ 1 ] ) == std::hash<uint64_t> { } ( 0x1006 ) );
}

TEST_CASE ( flowchart_leaves_logging_to_host ) {
	ArchOptions options { };
	options.verbose = 1;
	StaticDisassembler disasm ( options );
	tests::add_diamond ( disasm );

	log::set_verbose ( false );
	FlowChart chart ( disasm, 0x1000 );
	CHECK ( !log::verbose ( ) );
}

TEST_CASE ( flowchart_find_block ) {
	StaticDisassembler disasm;
	tests::add_diamond ( disasm );
	FlowChart chart ( disasm, 0x1000 );

	CHECK ( chart.find_block ( 0x1000 ) == &chart [ 0 ] );
	CHECK ( chart.find_block ( 0x1005 ) == &chart [ 0 ] );
	CHECK ( chart.find_block ( 0x1006 ) == &chart [ 1 ] );
	CHECK ( chart.find_block ( 0x1011 ) == &chart [ 2 ] );
	CHECK ( chart.find_block ( 0x1015 ) == &chart [ 3 ] );
	CHECK ( chart.find_block ( 0x1016 ) == nullptr );
	CHECK ( chart.find_block ( 0xFFF ) == nullptr );

	for ( uint64_t address = 0x1000; address < 0x1016; ++address ) {
		const auto* block = chart.find_block ( address );
		CHECK ( block && block->contains ( address ) );
	}
}

TEST_CASE ( flowchart_rejects_unknown_function ) {
	StaticDisassembler disasm;
	tests::add_diamond ( disasm );
	CHECK_THROWS ( FlowChart ( disasm, 0x5000 ), InvalidFunctionError );
	CHECK_THROWS ( FlowChart ( disasm, 0x1016 ), InvalidFunctionError );
}

TEST_CASE ( flowchart_forward_traversal ) {
	StaticDisassembler disasm;
	tests::add_diamond ( disasm );
	FlowChart chart ( disasm, 0x1000 );

	CHECK ( starts ( chart.dfs_iter_blocks ( ) ) == ( std::vector<uint64_t> { 0x1000, 0x1006, 0x1012, 0x100d } ) );
	CHECK ( starts ( chart.bfs_iter_blocks ( ) ) == ( std::vector<uint64_t> { 0x1000, 0x1006, 0x100d, 0x1012 } ) );

	// Output starts once the block holding the address is reached
	CHECK ( starts ( chart.dfs_iter_blocks ( 0x100e ) ) == ( std::vector<uint64_t> { 0x100d } ) );
	CHECK ( starts ( chart.bfs_iter_blocks ( 0x1007 ) ) == ( std::vector<uint64_t> { 0x1006, 0x100d, 0x1012 } ) );
	CHECK ( starts ( chart.dfs_iter_blocks ( 0x9000 ) ).empty ( ) );

	// Ranges can be walked again
	const auto range = chart.dfs_iter_blocks ( );
	CHECK ( starts ( range ) == starts ( range ) );
}

TEST_CASE ( flowchart_reverse_traversal ) {
	StaticDisassembler disasm;
	tests::add_diamond ( disasm );
	FlowChart chart ( disasm, 0x1000 );

	CHECK ( starts ( chart.dfs_iter_blocks ( std::nullopt, true ) ) == ( std::vector<uint64_t> { 0x1012, 0x100d, 0x1000, 0x1006, 0x1000 } ) );
	CHECK ( starts ( chart.bfs_iter_blocks ( std::nullopt, true ) ) == ( std::vector<uint64_t> { 0x1012, 0x100d, 0x1006, 0x1000, 0x1000 } ) );
	CHECK ( starts ( chart.dfs_iter_blocks ( 0x1007, true ) ) == ( std::vector<uint64_t> { 0x1006, 0x1000 } ) );
	CHECK ( starts ( chart.bfs_iter_blocks ( 0x9000, true ) ).empty ( ) );
}

TEST_CASE ( flowchart_reverse_skips_loop_edges ) {
	// A -> B -> C -> D with C -> B looping back
	StaticDisassembler disasm;
	disasm.add_function ( 0x2000, 0x2040 );
	disasm.add_block ( 0x2000, BlockInfo { 0x2000, 0x2010, { 0x2010 } } );
	disasm.add_block ( 0x2000, BlockInfo { 0x2010, 0x2020, { 0x2020 } } );
	disasm.add_block ( 0x2000, BlockInfo { 0x2020, 0x2030, { 0x2010, 0x2030 } } );
	disasm.add_block ( 0x2000, BlockInfo { 0x2030, 0x2040, { } } );
	FlowChart chart ( disasm, 0x2000 );

	CHECK ( starts ( chart.dfs_iter_blocks ( ) ) == ( std::vector<uint64_t> { 0x2000, 0x2010, 0x2020, 0x2030 } ) );

	for ( const auto* start : { &chart [ 1 ], &chart [ 2 ], &chart [ 3 ] } ) {
		const Block* previous = nullptr;
		for ( const auto* block : chart.dfs_iter_blocks ( start->start ( ), true ) ) {
			if ( previous ) {
				CHECK ( block->start ( ) < previous->start ( ) );
			}
			previous = block;
		}
	}
	CHECK ( starts ( chart.bfs_iter_blocks ( 0x2010, true ) ) == ( std::vector<uint64_t> { 0x2010, 0x2000 } ) );
}

TEST_CASE ( flowchart_head_traversal ) {
	StaticDisassembler disasm;
	tests::add_diamond ( disasm );
	FlowChart chart ( disasm, 0x1000 );

	CHECK ( collect ( chart.dfs_iter_heads ( ) ) == ( std::vector<uint64_t> { 0x1000, 0x1002, 0x1004, 0x1006, 0x100b, 0x1012, 0x1015, 0x100d } ) );
	CHECK ( collect ( chart.bfs_iter_heads ( ) ) == ( std::vector<uint64_t> { 0x1000, 0x1002, 0x1004, 0x1006, 0x100b, 0x100d, 0x1012, 0x1015 } ) );

	// The first block is entered at the requested address
	CHECK ( collect ( chart.dfs_iter_heads ( 0x1002 ) ) == ( std::vector<uint64_t> { 0x1002, 0x1004, 0x1006, 0x100b, 0x1012, 0x1015, 0x100d } ) );
	// Reverse walks start before the requested address
	CHECK ( collect ( chart.dfs_iter_heads ( 0x100b, true ) ) == ( std::vector<uint64_t> { 0x1006, 0x1004, 0x1002, 0x1000 } ) );
	CHECK ( collect ( chart.dfs_iter_heads ( 0x1006, true ) ) == ( std::vector<uint64_t> { 0x1004, 0x1002, 0x1000 } ) );
	CHECK ( collect ( chart.traverse_heads ( TraversalOrder::BFS, 0x1015, true ) ) ==
		( std::vector<uint64_t> { 0x1012, 0x100d, 0x100b, 0x1006, 0x1004, 0x1002, 0x1000, 0x1004, 0x1002, 0x1000 } ) );
}

TEST_CASE ( flowchart_paths_to ) {
	StaticDisassembler disasm;
	tests::add_diamond ( disasm );
	FlowChart chart ( disasm, 0x1000 );

	std::vector<std::vector<uint64_t>> found;
	chart.paths_to ( 0x1013, [ &found ] ( const std::vector<const Block*>& blocks ) {
		std::vector<uint64_t> path;
		for ( const auto* block : blocks ) {
			path.push_back ( block->start ( ) );
		}
		found.push_back ( path );
		return true;
	} );
	CHECK_EQ ( found.size ( ), 2u );
	CHECK ( found [ 0 ] == ( std::vector<uint64_t> { 0x1000, 0x100d, 0x1012 } ) );
	CHECK ( found [ 1 ] == ( std::vector<uint64_t> { 0x1000, 0x1006, 0x1012 } ) );

	std::size_t calls = 0;
	chart.paths_to ( 0x1013, [ &calls ] ( const std::vector<const Block*>& ) {
		++calls;
		return false;
	} );
	CHECK_EQ ( calls, 1u );

	CHECK_THROWS ( chart.paths_to ( 0x9000, [ ] ( const std::vector<const Block*>& ) { return true; } ), AddressOutOfRangeError );
}
