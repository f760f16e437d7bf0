#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <context/processor_context.hpp>
#include "block.hpp"

namespace traceflow
{
	class FlowChart;

	// One path prefix: a block linked to the path that reached it.
	// Nodes live in the flowchart's arena and are referenced by index.
	struct PathNode {
		const Block* block = nullptr;
		std::optional<std::size_t> parent {};
		// Cached state and the address it has been filled to (exclusive)
		std::optional<ProcessorContext> context {};
		uint64_t fill = 0;
	};

	// Handle to a path node of a flowchart. Valid as long as the flowchart is.
	class Path {
	public:
		Path ( FlowChart& chart, std::size_t node ) noexcept : chart ( &chart ), node ( node ) { }

		[[nodiscard]] const Block& block ( ) const;

		// Path up to the previous block, std::nullopt at a path root
		[[nodiscard]] std::optional<Path> parent ( ) const;

		[[nodiscard]] bool contains ( uint64_t address ) const;

		/**
		 * @brief Processor state after replaying this path up to and including `address`.
		 * Without an address the whole block is replayed. Returns a copy; the cached state stays with the path.
		 * Throws AddressOutOfRangeError if `address` is outside this path's block.
		 */
		[[nodiscard]] ProcessorContext context ( std::optional<uint64_t> address = std::nullopt ) const;

		// Blocks from the path root to this block
		[[nodiscard]] std::vector<const Block*> blocks ( ) const;

		[[nodiscard]] std::size_t length ( ) const;

		// Address the cached state has been filled to, std::nullopt before the first context request
		[[nodiscard]] std::optional<uint64_t> fill_point ( ) const;

		[[nodiscard]] std::size_t id ( ) const noexcept {
			return node;
		}

		[[nodiscard]] bool operator==( const Path& other ) const noexcept {
			return chart == other.chart && node == other.node;
		}

	private:
		[[nodiscard]] PathNode& get_node ( ) const;

		FlowChart* chart;
		std::size_t node;
	};
};
