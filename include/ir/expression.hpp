#pragma once

#include <memory>

#include "../wrapped_types.hpp"
#include "type.hpp"

namespace shir::ir {

struct Expr;

// Floating point literal
struct Numeric {
	double value;
};

// Use of a uniform, attribute, varying or local
struct VariableReference {
	Variable variable;
};

// Unary operation
//
//   code: operation type (OperationCode)
//   a: operand
struct Unary {
	OperationCode code;
	std::shared_ptr <const Expr> a;
};

// Binary operation
//
//   code: operation type (OperationCode)
//   a: left operand
//   b: right operand
struct Binary {
	OperationCode code;
	std::shared_ptr <const Expr> a;
	std::shared_ptr <const Expr> b;
};

using expr_base = wrapped::variant <
	Numeric,
	VariableReference,
	Unary,
	Binary
>;

struct Expr : expr_base {
	using expr_base::expr_base;
};

// Construction helpers
Expr numeric(double);
Expr reference(VariableCategory, int);
Expr unary(OperationCode, const Expr &);
Expr binary(OperationCode, const Expr &, const Expr &);

} // namespace shir::ir
