#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

namespace traceflow
{
	// Lazily evaluated sequence driven by a cursor with `std::optional<value_type> next ( )`.
	// Every begin() starts from a copy of the initial cursor, so a sequence can be walked again.
	template <typename Cursor>
	class LazySequence {
	public:
		using value_type = typename Cursor::value_type;

		class iterator {
		public:
			using iterator_category = std::input_iterator_tag;
			using difference_type = std::ptrdiff_t;
			using value_type = typename Cursor::value_type;
			using reference = const value_type&;
			using pointer = const value_type*;

			iterator ( ) = default;

			explicit iterator ( Cursor start ) : cursor ( std::move ( start ) ) {
				advance ( );
			}

			reference operator*( ) const {
				return *current;
			}

			pointer operator->( ) const {
				return &*current;
			}

			iterator& operator++( ) {
				advance ( );
				return *this;
			}

			void operator++( int ) {
				advance ( );
			}

			friend bool operator==( const iterator& it, std::default_sentinel_t ) noexcept {
				return !it.current.has_value ( );
			}

		private:
			void advance ( ) {
				current = cursor->next ( );
			}

			std::optional<Cursor> cursor;
			std::optional<value_type> current;
		};

		explicit LazySequence ( Cursor start ) : initial ( std::move ( start ) ) { }

		[[nodiscard]] iterator begin ( ) const {
			return iterator ( initial );
		}

		[[nodiscard]] std::default_sentinel_t end ( ) const noexcept {
			return std::default_sentinel;
		}

	private:
		Cursor initial;
	};
};
