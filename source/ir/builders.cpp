#include "ir/expression.hpp"
#include "ir/statement.hpp"

namespace shir::ir {

Expr numeric(double value)
{
	return Numeric { value };
}

Expr reference(VariableCategory category, int index)
{
	return VariableReference { Variable { category, index } };
}

Expr unary(OperationCode code, const Expr &a)
{
	return Unary { code, std::make_shared <const Expr> (a) };
}

Expr binary(OperationCode code, const Expr &a, const Expr &b)
{
	return Binary {
		code,
		std::make_shared <const Expr> (a),
		std::make_shared <const Expr> (b)
	};
}

Stmt block_stmt(const Block &block)
{
	return NestedBlock { block };
}

Stmt assign(const Expr &dst, const Expr &src)
{
	return Assign { dst, src };
}

Stmt branch(const Expr &cond, const Block &then_block, const Block &else_block)
{
	return If { cond, then_block, else_block };
}

Stmt loop(int init, int limit, int step, const Block &body)
{
	return For { init, limit, step, body };
}

Stmt jump(JumpKind kind)
{
	return Jump { kind };
}

} // namespace shir::ir
