#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <capstone/x86.h>
#include <types.hpp>

namespace traceflow
{
	// Where a sized register name lives inside its 64-bit parent
	struct RegisterAccess {
		Register reg = RAX;
		uint8_t size = 8;
		uint8_t shift = 0; // 8 for AH/CH/DH/BH
	};

	// Name of `reg` at `width` bytes, eg. register_name ( RAX, 4 ) == "eax". Throws InvalidWidthError.
	[[nodiscard]] std::string_view register_name ( Register reg, std::size_t width );

	// Capstone id of `reg` at `width` bytes. Throws InvalidWidthError.
	[[nodiscard]] x86_reg to_capstone ( Register reg, std::size_t width );

	// Maps a capstone general purpose register (any width) to its 64-bit parent
	[[nodiscard]] std::optional<RegisterAccess> from_capstone ( x86_reg reg ) noexcept;
};
