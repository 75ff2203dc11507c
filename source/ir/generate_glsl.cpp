#include <string>

#include <fmt/format.h>

#include "ir/glsl_generator.hpp"
#include "ir/program.hpp"

namespace shir::ir {

std::string Program::generate_glsl(const profiles::glsl_version &profile) const
{
	detail::glsl_struct_table_t structs;

	// Global shader variables; struct names are
	// assigned in the order of their first use
	std::string globals;
	for (size_t i = 0; i < uniforms.size(); i++) {
		globals += fmt::format("uniform {} {};\n",
			structs.type_to_string(uniforms[i]),
			variable_name(uniform, i));
	}

	for (size_t i = 0; i < attributes.size(); i++) {
		globals += fmt::format("attribute {} {};\n",
			structs.type_to_string(attributes[i]),
			variable_name(attribute, i));
	}

	for (size_t i = 0; i < varyings.size(); i++) {
		globals += fmt::format("varying {} {};\n",
			structs.type_to_string(varyings[i]),
			variable_name(varying, i));
	}

	// Synthesize all functions
	std::string functions;
	for (auto &func : funcs) {
		detail::glsl_generator_t generator(*this, structs, func);
		functions += generator.generate();
	}

	std::string source;
	if (profile.version)
		source += fmt::format("#version {}\n", profile.version);
	if (profile.precision)
		source += fmt::format("precision {} float;\n", profile.precision);

	source += structs.definitions + globals + functions;

	// Empty programs still end with a line terminator
	if (source.empty())
		source = "\n";

	return source;
}

} // namespace shir::ir
