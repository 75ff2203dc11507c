#pragma once

#include <string>
#include <vector>

#include "../profiles/targets.hpp"
#include "statement.hpp"
#include "type.hpp"

namespace shir::ir {

// Function returning void; parameters take the first
// local indices in the order in, inout, then out
struct Func {
	std::string name;
	std::vector <Type> in_params;
	std::vector <Type> inout_params;
	std::vector <Type> out_params;
	Block block;
};

struct Program {
	std::vector <Type> uniforms;
	std::vector <Type> attributes;
	std::vector <Type> varyings;
	std::vector <Func> funcs;

	std::string generate_glsl(const profiles::glsl_version & = profiles::glsl_plain) const;
};

} // namespace shir::ir
