#pragma once

#include <gtest/gtest.h>

#include <string>

#include "shir.hpp"

// Exact source comparison; both sides are displayed on mismatch
inline void check_shader_sources(const std::string &expected, const std::string &generated)
{
	if (expected != generated) {
		shir::io::display_lines("EXPECTED", expected);
		shir::io::display_lines("GENERATED", generated);
	}

	ASSERT_EQ(expected, generated);
}

// F0 with two float inputs (l0, l1) and one float output (l2)
inline shir::ir::Func binary_function(const shir::ir::Block &block)
{
	using namespace shir::ir;

	return Func {
		.name = "F0",
		.in_params = { { .main = f32 }, { .main = f32 } },
		.out_params = { { .main = f32 } },
		.block = block,
	};
}

inline const std::string binary_signature = "void F0(in float l0, in float l1, out float l2) {\n";

// Source of F0 assigning the given expression to l2
inline std::string generate_assignment(const shir::ir::Expr &value)
{
	using namespace shir::ir;

	Program program {
		.funcs = {
			binary_function(Block {
				.statements = { assign(reference(local, 2), value) },
			}),
		},
	};

	return program.generate_glsl();
}

inline std::string expected_assignment(const std::string &value)
{
	return binary_signature + "\tl2 = " + value + ";\n" + "}\n";
}
