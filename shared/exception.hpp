#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <fmt/format.h>

namespace traceflow
{
	class TracingError : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Address does not belong to any function known to the disassembler
	class InvalidFunctionError : public TracingError {
	public:
		explicit InvalidFunctionError ( uint64_t address )
			: TracingError ( fmt::format ( "address {:#x} is not inside a known function", address ) ), address_ ( address ) { }

		[[nodiscard]] uint64_t address ( ) const noexcept {
			return address_;
		}

	private:
		uint64_t address_;
	};

	class AddressOutOfRangeError : public TracingError {
	public:
		AddressOutOfRangeError ( uint64_t address, uint64_t start, uint64_t end )
			: TracingError ( fmt::format ( "address {:#x} not in range ({:#x} :: {:#x})", address, start, end ) ), address_ ( address ) { }

		[[nodiscard]] uint64_t address ( ) const noexcept {
			return address_;
		}

	private:
		uint64_t address_;
	};

	class AddressDecodeError : public TracingError {
	public:
		using TracingError::TracingError;
	};

	class InvalidWidthError : public TracingError {
	public:
		explicit InvalidWidthError ( std::size_t width )
			: TracingError ( fmt::format ( "invalid width: {}", width ) ), width_ ( width ) { }

		[[nodiscard]] std::size_t width ( ) const noexcept {
			return width_;
		}

	private:
		std::size_t width_;
	};

	class InvalidPrecisionError : public TracingError {
	public:
		explicit InvalidPrecisionError ( int precision )
			: TracingError ( fmt::format ( "precision {} is not valid", precision ) ) { }
	};

	class DisassemblyError : public TracingError {
	public:
		using TracingError::TracingError;
	};
};
