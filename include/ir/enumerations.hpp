#pragma once

#include <cstdint>

namespace shir::ir {

/////////////////////
// Primitive types //
/////////////////////

enum PrimitiveType : int8_t {
	bad,

	// Scalar types
	f32,

	// Vector types
	vec2,
	vec3,
	vec4,

	// Matrix types
	mat2,
	mat3,
	mat4,

	// Aggregate of member types
	structure,

	__pt_end
};

extern const char *tbl_primitive_types[__pt_end];

/////////////////////////
// Variable categories //
/////////////////////////

enum VariableCategory : int8_t {
	uniform,
	attribute,
	varying,
	local,

	__vc_end
};

// Prefixes of synthesized variable names
extern const char *tbl_variable_category[__vc_end];

////////////////////
// Operation Code //
////////////////////

enum OperationCode : int8_t {
	// Unary operations
	negation,
	bool_not,

	// Arithmetic
	addition,
	subtraction,
	multiplication,
	division,
	modulus,

	// Bitwise
	bit_shift_left,
	bit_shift_right,
	bit_and,
	bit_xor,
	bit_or,

	// Logical
	bool_and,
	bool_or,

	// Comparison
	less_than,
	less_equal,
	greater_than,
	greater_equal,
	equals,
	not_equals,

	__oc_end
};

extern const char *tbl_operation_code[__oc_end];

////////////////
// Jump kinds //
////////////////

enum JumpKind : int8_t {
	skip,
	stop,
	returns,
	discard,

	__jk_end
};

// Keywords of each jump
extern const char *tbl_jump_kind[__jk_end];

} // namespace shir::ir
