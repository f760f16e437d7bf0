#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <disasm/disassembler.hpp>
#include <context/processor_context.hpp>
#include "block.hpp"
#include "path.hpp"
#include "sequence.hpp"

namespace traceflow
{
	enum class TraversalOrder : uint8_t {
		DFS = 0,
		BFS
	};

	class FlowChart;

	// Block walk state. Forward walks visit every block reachable from the entry once;
	// reverse walks follow predecessors with a lower start address only.
	class BlockCursor {
	public:
		using value_type = const Block*;

		BlockCursor ( const FlowChart& chart, TraversalOrder order, std::optional<uint64_t> start, bool reverse );

		std::optional<value_type> next ( );

	private:
		void schedule ( std::vector<const Block*> blocks );

		TraversalOrder order;
		bool reverse;
		std::optional<uint64_t> start;
		bool found;
		std::deque<const Block*> pending;
		std::unordered_set<uint64_t> visited;
	};

	// Instruction address walk over a block walk
	class HeadCursor {
	public:
		using value_type = uint64_t;

		HeadCursor ( const FlowChart& chart, TraversalOrder order, std::optional<uint64_t> start, bool reverse );

		std::optional<value_type> next ( );

	private:
		const FlowChart* chart;
		BlockCursor blocks;
		std::optional<uint64_t> start;
		bool reverse;
		bool first_block = true;
		std::vector<uint64_t> heads;
		std::size_t position = 0;
	};

	// Walks the path cache of one block, extending it on demand
	class PathCursor {
	public:
		using value_type = Path;

		PathCursor ( FlowChart& chart, const Block* block ) noexcept : chart ( &chart ), block ( block ) { }

		std::optional<value_type> next ( );

	private:
		FlowChart* chart;
		const Block* block;
		std::size_t position = 0;
	};

	using BlockRange = LazySequence<BlockCursor>;
	using HeadRange = LazySequence<HeadCursor>;
	using PathRange = LazySequence<PathCursor>;

	/**
	 * @brief Control flow graph of one function with traversal, path enumeration and per path processor state.
	 *
	 * Paths are enumerated lazily and cached per block: every path node ever produced for a block is kept
	 * and later requests for that block (or for blocks after it) reuse them. Not thread safe; all access
	 * to one flowchart has to be serialized by the caller.
	 */
	class FlowChart {
	public:
		// Throws InvalidFunctionError if `address` is not inside a function known to `disassembler`
		FlowChart ( const Disassembler& disassembler, uint64_t address, ProcessorStep step = { } );

		FlowChart ( const FlowChart& ) = delete;
		FlowChart& operator=( const FlowChart& ) = delete;
		FlowChart ( FlowChart&& ) = delete;
		FlowChart& operator=( FlowChart&& ) = delete;

		[[nodiscard]] const AddressRange& bounds ( ) const noexcept {
			return function_bounds;
		}

		[[nodiscard]] const std::vector<Block>& blocks ( ) const noexcept {
			return block_list;
		}

		[[nodiscard]] std::size_t size ( ) const noexcept {
			return block_list.size ( );
		}

		[[nodiscard]] const Block& entry ( ) const noexcept {
			return block_list.front ( );
		}

		[[nodiscard]] const Block& operator[]( std::size_t index ) const {
			return block_list.at ( index );
		}

		// Block containing `address`, nullptr if there is none
		[[nodiscard]] const Block* find_block ( uint64_t address ) const;

		[[nodiscard]] BlockRange traverse_blocks ( TraversalOrder order, std::optional<uint64_t> start = std::nullopt, bool reverse = false ) const;
		[[nodiscard]] HeadRange traverse_heads ( TraversalOrder order, std::optional<uint64_t> start = std::nullopt, bool reverse = false ) const;

		[[nodiscard]] BlockRange dfs_iter_blocks ( std::optional<uint64_t> start = std::nullopt, bool reverse = false ) const {
			return traverse_blocks ( TraversalOrder::DFS, start, reverse );
		}
		[[nodiscard]] BlockRange bfs_iter_blocks ( std::optional<uint64_t> start = std::nullopt, bool reverse = false ) const {
			return traverse_blocks ( TraversalOrder::BFS, start, reverse );
		}
		[[nodiscard]] HeadRange dfs_iter_heads ( std::optional<uint64_t> start = std::nullopt, bool reverse = false ) const {
			return traverse_heads ( TraversalOrder::DFS, start, reverse );
		}
		[[nodiscard]] HeadRange bfs_iter_heads ( std::optional<uint64_t> start = std::nullopt, bool reverse = false ) const {
			return traverse_heads ( TraversalOrder::BFS, start, reverse );
		}

		/**
		 * @brief Every path from a root block to the block containing `address`.
		 * The sequence is lazy and potentially huge; consume only as many paths as needed.
		 * Empty if `address` is not inside a block of this function.
		 */
		[[nodiscard]] PathRange get_paths ( uint64_t address );

		/**
		 * @brief Calls `callback` with the blocks of every loop free walk from the entry that reaches the block
		 * containing `address`. Returning false from the callback stops the walk.
		 * Throws AddressOutOfRangeError if `address` is outside the function.
		 */
		void paths_to ( uint64_t address, const std::function<bool ( const std::vector<const Block*>& )>& callback ) const;

		// Number of path nodes built so far
		[[nodiscard]] std::size_t path_count ( ) const noexcept {
			return nodes.size ( );
		}

		[[nodiscard]] const Disassembler& disassembler ( ) const noexcept {
			return disasm;
		}

	private:
		friend class Path;
		friend class PathCursor;

		// Enumeration state of the paths ending at one block
		struct PathGenerator {
			std::vector<const Block*> parents {};
			std::size_t parent_position = 0;
			std::size_t parent_path_position = 0;
			bool root_pending = false;
			bool exhausted = false;
		};

		// Produces one more path for `block` into its cache. False once all paths are known.
		bool advance_paths ( const Block& block );

		PathGenerator& generator ( const Block& block );

		std::size_t add_node ( const Block& block, std::optional<std::size_t> parent );

		bool walk_paths ( uint64_t address, const Block& current, std::unordered_set<uint64_t>& visited,
			std::vector<const Block*>& current_path, const std::function<bool ( const std::vector<const Block*>& )>& callback ) const;

		const Disassembler& disasm;
		ProcessorStep step;
		AddressRange function_bounds;
		std::vector<Block> block_list;
		// Indices into block_list ordered by start address
		std::vector<std::size_t> by_start;

		std::deque<PathNode> nodes;
		std::unordered_map<uint64_t, std::vector<std::size_t>> path_cache;
		std::unordered_map<uint64_t, PathGenerator> generators;
	};
};
