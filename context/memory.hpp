#ifndef TRACEFLOW_MEMORY_HPP
#define TRACEFLOW_MEMORY_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <map>
#include <vector>

namespace traceflow
{
	// Sparse, page granular memory view of one processor context.
	// Pages are held by value so copying a Memory copies its contents.
	class Memory {
	public:
		static constexpr std::size_t page_size = 0x1000;

		// Unmapped bytes read as zero
		void read_bytes ( uint64_t addr, void* dest, std::size_t size ) const;
		void write_bytes ( uint64_t addr, const void* src, std::size_t size );

		[[nodiscard]] std::vector<uint8_t> read ( uint64_t addr, std::size_t size ) const {
			std::vector<uint8_t> buffer ( size );
			read_bytes ( addr, buffer.data ( ), size );
			return buffer;
		}

		void write ( uint64_t addr, const std::vector<uint8_t>& data ) {
			write_bytes ( addr, data.data ( ), data.size ( ) );
		}

		[[nodiscard]] bool is_mapped ( uint64_t addr ) const {
			return pages.contains ( page_base ( addr ) );
		}

		[[nodiscard]] std::size_t page_count ( ) const noexcept {
			return pages.size ( );
		}

	private:
		using Page = std::array<uint8_t, page_size>;
		std::map<uint64_t, Page> pages;

		[[nodiscard]] static constexpr uint64_t page_base ( uint64_t addr ) noexcept {
			return addr & ~( static_cast< uint64_t >( page_size ) - 1 );
		}
	};

	inline void Memory::read_bytes ( uint64_t addr, void* dest, std::size_t size ) const {
		uint8_t* d = static_cast< uint8_t* > ( dest );
		std::size_t remaining = size;
		uint64_t current = addr;
		while ( remaining > 0 ) {
			std::size_t offset = current % page_size;
			std::size_t to_copy = std::min ( remaining, page_size - offset );
			auto it = pages.find ( page_base ( current ) );
			if ( it == pages.end ( ) ) {
				std::memset ( d, 0, to_copy );
			}
			else {
				std::memcpy ( d, it->second.data ( ) + offset, to_copy );
			}
			d += to_copy;
			current += to_copy;
			remaining -= to_copy;
		}
	}

	inline void Memory::write_bytes ( uint64_t addr, const void* src, std::size_t size ) {
		const uint8_t* s = static_cast< const uint8_t* >( src );
		std::size_t remaining = size;
		uint64_t current = addr;
		while ( remaining > 0 ) {
			std::size_t offset = current % page_size;
			std::size_t to_copy = std::min ( remaining, page_size - offset );
			auto [it, inserted] = pages.try_emplace ( page_base ( current ) );
			if ( inserted ) {
				it->second.fill ( 0 );
			}
			std::memcpy ( it->second.data ( ) + offset, s, to_copy );
			s += to_copy;
			current += to_copy;
			remaining -= to_copy;
		}
	}
} // namespace traceflow

#endif
