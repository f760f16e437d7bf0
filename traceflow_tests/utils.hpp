#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <disasm/disassembler.hpp>

namespace traceflow::tests
{
	struct TestCase {
		const char* name;
		void ( *run ) ( );
	};

	inline std::vector<TestCase>& registry ( ) {
		static std::vector<TestCase> cases;
		return cases;
	}

	// Number of failed checks in the running test
	inline std::size_t& check_failures ( ) {
		static std::size_t failures = 0;
		return failures;
	}

	struct Registrar {
		Registrar ( const char* name, void ( *run ) ( ) ) {
			registry ( ).push_back ( TestCase { name, run } );
		}
	};

	inline void report_failure ( const char* file, int line, const std::string& what ) {
		++check_failures ( );
		fmt::print ( "[!] {}:{}: {}\n", file, line, what );
	}

	/*
	 * Diamond shaped function used by most flowchart tests
	 *
	 *          A 0x1000 (0x1000, 0x1002, 0x1004)
	 *         / \
	 * B 0x1006   C 0x100d
	 *  (0x1006,   (0x100d)
	 *   0x100b)
	 *         \ /
	 *          D 0x1012 (0x1012, 0x1015)
	 */
	inline void add_diamond ( StaticDisassembler& disasm ) {
		disasm.add_function ( 0x1000, 0x1016 );
		disasm.add_block ( 0x1000, BlockInfo { 0x1000, 0x1006, { 0x100d, 0x1006 } } );
		disasm.add_block ( 0x1000, BlockInfo { 0x1006, 0x100d, { 0x1012 } } );
		disasm.add_block ( 0x1000, BlockInfo { 0x100d, 0x1012, { 0x1012 } } );
		disasm.add_block ( 0x1000, BlockInfo { 0x1012, 0x1016, { } } );
		for ( const uint64_t ip : { 0x1000, 0x1002, 0x1004, 0x1006, 0x100b, 0x100d, 0x1012, 0x1015 } ) {
			disasm.add_instruction ( ip );
		}
	}
};

#define TRACEFLOW_CONCAT_INNER( a, b ) a##b
#define TRACEFLOW_CONCAT( a, b ) TRACEFLOW_CONCAT_INNER ( a, b )

#define TEST_CASE( name )                                                                                  \
	static void name ( );                                                                                    \
	static const traceflow::tests::Registrar TRACEFLOW_CONCAT ( name, _registrar ) { #name, &name };        \
	static void name ( )

#define CHECK( expr )                                                                                      \
	do {                                                                                                     \
		if ( !( expr ) ) {                                                                                     \
			traceflow::tests::report_failure ( __FILE__, __LINE__, "CHECK ( " #expr " )" );                    \
		}                                                                                                      \
	} while ( false )

#define CHECK_EQ( actual, expected )                                                                       \
	do {                                                                                                     \
		const auto traceflow_actual = ( actual );                                                              \
		const auto traceflow_expected = ( expected );                                                          \
		if ( !( traceflow_actual == traceflow_expected ) ) {                                                   \
			traceflow::tests::report_failure ( __FILE__, __LINE__,                                               \
				fmt::format ( "{} == {}: {:#x} != {:#x}", #actual, #expected, traceflow_actual, traceflow_expected ) ); \
		}                                                                                                      \
	} while ( false )

#define CHECK_THROWS( expr, exception_type )                                                               \
	do {                                                                                                     \
		bool traceflow_thrown = false;                                                                         \
		try {                                                                                                  \
			( void ) ( expr );                                                                                   \
		}                                                                                                      \
		catch ( const exception_type& ) {                                                                      \
			traceflow_thrown = true;                                                                             \
		}                                                                                                      \
		if ( !traceflow_thrown ) {                                                                             \
			traceflow::tests::report_failure ( __FILE__, __LINE__, #expr " did not throw " #exception_type );   \
		}                                                                                                      \
	} while ( false )
