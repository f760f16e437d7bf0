#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <types.hpp>

namespace traceflow
{
	// Basic block of a flowchart. Identity is the start address.
	class Block {
	public:
		Block ( uint64_t start, uint64_t end, std::size_t index ) noexcept
			: start_ ( start ), end_ ( end ), index_ ( index ) { }

		[[nodiscard]] uint64_t start ( ) const noexcept {
			return start_;
		}
		[[nodiscard]] uint64_t end ( ) const noexcept {
			return end_;
		}
		[[nodiscard]] AddressRange range ( ) const noexcept {
			return { start_, end_ };
		}
		// Position in the owning flowchart, 0 is the entry block
		[[nodiscard]] std::size_t index ( ) const noexcept {
			return index_;
		}

		[[nodiscard]] const std::vector<const Block*>& successors ( ) const noexcept {
			return successors_;
		}
		[[nodiscard]] const std::vector<const Block*>& predecessors ( ) const noexcept {
			return predecessors_;
		}

		[[nodiscard]] bool contains ( uint64_t address ) const noexcept {
			return start_ <= address && address < end_;
		}

		[[nodiscard]] bool operator==( const Block& other ) const noexcept {
			return start_ == other.start_;
		}

		[[nodiscard]] std::string to_string ( ) const {
			return fmt::format ( "<Block(start={:#010x}, end={:#010x})>", start_, end_ );
		}

	private:
		friend class FlowChart;

		uint64_t start_;
		uint64_t end_;
		std::size_t index_;
		std::vector<const Block*> successors_;
		std::vector<const Block*> predecessors_;
	};
};

template <>
struct std::hash<traceflow::Block> {
	std::size_t operator()( const traceflow::Block& block ) const noexcept {
		return std::hash<uint64_t> { } ( block.start ( ) );
	}
};
