#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "shir.hpp"

using namespace shir;
using namespace shir::ir;

TEST(io, split_lines)
{
	auto lines = io::split_lines("uniform float U0;\nvoid F0(void) {\n}\n");

	ASSERT_EQ(lines.size(), 3u);
	ASSERT_EQ(lines[0], "uniform float U0;");
	ASSERT_EQ(lines[1], "void F0(void) {");
	ASSERT_EQ(lines[2], "}");
}

TEST(io, split_lines_of_empty_program)
{
	auto lines = io::split_lines("\n");

	ASSERT_EQ(lines.size(), 1u);
	ASSERT_TRUE(lines[0].empty());
}

TEST(io, write_lines_preserves_source)
{
	Program program {
		.uniforms = { { .main = structure, .sub = { { .main = f32 } } } },
		.funcs = {
			{
				.name = "F0",
				.out_params = { { .main = f32 } },
				.block = { .statements = { loop(0, 4, 1, Block {}) } },
			},
		},
	};

	std::string source = program.generate_glsl();

	auto path = std::filesystem::temp_directory_path() / "shir_write_lines.glsl";
	io::write_lines(path, source);

	std::ifstream fin(path);
	std::stringstream contents;
	contents << fin.rdbuf();

	ASSERT_EQ(contents.str(), source);

	std::filesystem::remove(path);
}
