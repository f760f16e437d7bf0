#pragma once

#include <atomic>
#include <utility>
#include <fmt/format.h>

namespace traceflow::log
{
	inline std::atomic<bool> verbose_enabled { false };

	inline void set_verbose ( bool enabled ) noexcept {
		verbose_enabled.store ( enabled, std::memory_order_relaxed );
	}

	[[nodiscard]] inline bool verbose ( ) noexcept {
		return verbose_enabled.load ( std::memory_order_relaxed );
	}

	template <typename... Args>
	void info ( fmt::format_string<Args...> format, Args&&... args ) {
		fmt::print ( "[+] {}\n", fmt::format ( format, std::forward<Args> ( args )... ) );
	}

	template <typename... Args>
	void error ( fmt::format_string<Args...> format, Args&&... args ) {
		fmt::print ( "[!] {}\n", fmt::format ( format, std::forward<Args> ( args )... ) );
	}

	// Only printed while verbose logging is on
	template <typename... Args>
	void debug ( fmt::format_string<Args...> format, Args&&... args ) {
		if ( !verbose ( ) ) {
			return;
		}
		fmt::print ( "[?] {}\n", fmt::format ( format, std::forward<Args> ( args )... ) );
	}
};
