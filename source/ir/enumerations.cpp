#include "ir/enumerations.hpp"

namespace shir::ir {

////////////////////
// Primitive type //
////////////////////

const char *tbl_primitive_types[] = {
	"<bad>",

	"float",

	"vec2",
	"vec3",
	"vec4",

	"mat2",
	"mat3",
	"mat4",

	"struct",
};

///////////////////////
// Variable category //
///////////////////////

const char *tbl_variable_category[] = {
	"U",
	"A",
	"V",
	"l",
};

////////////////////
// Operation Code //
////////////////////

const char *tbl_operation_code[] = {
	"negate",
	"lnot",

	"add",
	"subtract",
	"multiply",
	"divide",
	"mod",

	"shle",
	"shri",
	"band",
	"bxor",
	"bor",

	"land",
	"lor",

	"lt",
	"leq",
	"gt",
	"geq",
	"eq",
	"neq",
};

///////////////
// Jump kind //
///////////////

const char *tbl_jump_kind[] = {
	"continue",
	"break",
	"return",
	"discard",
};

} // namespace shir::ir
