#include <gtest/gtest.h>

#include "shir.hpp"
#include "util.hpp"

using namespace shir;
using namespace shir::ir;

TEST(generate_glsl_structs, uniform_struct)
{
	Program program {
		.uniforms = {
			{ .main = structure, .sub = { { .main = f32 } } },
		},
	};

	check_shader_sources(
		"struct S0 {\n"
		"\tfloat M0;\n"
		"};\n"
		"uniform S0 U0;\n",
		program.generate_glsl());
}

TEST(generate_glsl_structs, member_names_follow_declaration_order)
{
	Program program {
		.uniforms = {
			{
				.main = structure,
				.sub = { { .main = vec4 }, { .main = mat3 }, { .main = f32 } },
			},
		},
	};

	check_shader_sources(
		"struct S0 {\n"
		"\tvec4 M0;\n"
		"\tmat3 M1;\n"
		"\tfloat M2;\n"
		"};\n"
		"uniform S0 U0;\n",
		program.generate_glsl());
}

TEST(generate_glsl_structs, nested_struct_defined_first)
{
	Type inner { .main = structure, .sub = { { .main = vec2 }, { .main = f32 } } };
	Type outer { .main = structure, .sub = { { .main = f32 }, inner } };

	Program program {
		.uniforms = { outer },
	};

	check_shader_sources(
		"struct S0 {\n"
		"\tvec2 M0;\n"
		"\tfloat M1;\n"
		"};\n"
		"struct S1 {\n"
		"\tfloat M0;\n"
		"\tS0 M1;\n"
		"};\n"
		"uniform S1 U0;\n",
		program.generate_glsl());
}

TEST(generate_glsl_structs, names_in_order_of_first_use)
{
	Type first { .main = structure, .sub = { { .main = f32 } } };
	Type second { .main = structure, .sub = { { .main = vec3 } } };

	Program program {
		.uniforms = { { .main = f32 }, second, first, second },
	};

	check_shader_sources(
		"struct S0 {\n"
		"\tvec3 M0;\n"
		"};\n"
		"struct S1 {\n"
		"\tfloat M0;\n"
		"};\n"
		"uniform float U0;\n"
		"uniform S0 U1;\n"
		"uniform S1 U2;\n"
		"uniform S0 U3;\n",
		program.generate_glsl());
}

TEST(generate_glsl_structs, shared_nested_member)
{
	Type light { .main = structure, .sub = { { .main = vec3 }, { .main = vec3 } } };
	Type scene { .main = structure, .sub = { light, light } };

	Program program {
		.uniforms = { scene, light },
	};

	check_shader_sources(
		"struct S0 {\n"
		"\tvec3 M0;\n"
		"\tvec3 M1;\n"
		"};\n"
		"struct S1 {\n"
		"\tS0 M0;\n"
		"\tS0 M1;\n"
		"};\n"
		"uniform S1 U0;\n"
		"uniform S0 U1;\n",
		program.generate_glsl());
}

TEST(generate_glsl_structs, structs_in_functions)
{
	Type uniform_type { .main = structure, .sub = { { .main = mat4 } } };
	Type param_type { .main = structure, .sub = { { .main = vec2 }, { .main = vec2 } } };
	Type local_type { .main = structure, .sub = { { .main = f32 }, { .main = f32 } } };

	Program program {
		.uniforms = { uniform_type },
		.funcs = {
			{
				.name = "F0",
				.in_params = { param_type },
				.out_params = { uniform_type },
				.block = {
					.locals = { local_type },
					.statements = { assign(reference(local, 1), reference(uniform, 0)) },
				},
			},
		},
	};

	check_shader_sources(
		"struct S0 {\n"
		"\tmat4 M0;\n"
		"};\n"
		"struct S1 {\n"
		"\tvec2 M0;\n"
		"\tvec2 M1;\n"
		"};\n"
		"struct S2 {\n"
		"\tfloat M0;\n"
		"\tfloat M1;\n"
		"};\n"
		"uniform S0 U0;\n"
		"void F0(in S1 l0, out S0 l1) {\n"
		"\tS2 l2;\n"
		"\tl1 = U0;\n"
		"}\n",
		program.generate_glsl());
}

TEST(generate_glsl_structs, struct_varying)
{
	Type interpolants { .main = structure, .sub = { { .main = vec4 }, { .main = vec2 } } };

	Program program {
		.attributes = { { .main = vec4 } },
		.varyings = { interpolants },
	};

	check_shader_sources(
		"struct S0 {\n"
		"\tvec4 M0;\n"
		"\tvec2 M1;\n"
		"};\n"
		"attribute vec4 A0;\n"
		"varying S0 V0;\n",
		program.generate_glsl());
}

TEST(generate_glsl_structs, type_description)
{
	Type inner { .main = structure, .sub = { { .main = vec2 } } };
	Type outer { .main = structure, .sub = { { .main = f32 }, inner } };

	ASSERT_EQ(Type { .main = mat3 }.to_string(), "mat3");
	ASSERT_EQ(outer.to_string(), "struct { float, struct { vec2 } }");
	ASSERT_TRUE(inner == (Type { .main = structure, .sub = { { .main = vec2 } } }));
	ASSERT_FALSE(inner == outer);
}
