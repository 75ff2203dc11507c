#pragma once

#include <string>
#include <vector>

#include "enumerations.hpp"

namespace shir::ir {

// Shape of a declaration
//
//   main: primitive tag, or structure for aggregates
//   sub: member types of a structure, in declaration order
struct Type {
	PrimitiveType main = bad;
	std::vector <Type> sub;

	bool operator==(const Type &) const;

	std::string to_string() const;
};

// Variable addressed by its index within the
// numbering domain of its category
struct Variable {
	VariableCategory category;
	int index;
};

// Synthesized name of a variable, e.g. U0 or l3
std::string variable_name(VariableCategory, int);

} // namespace shir::ir
