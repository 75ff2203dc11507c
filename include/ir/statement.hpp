#pragma once

#include <vector>

#include "../wrapped_types.hpp"
#include "expression.hpp"
#include "type.hpp"

namespace shir::ir {

struct Stmt;

// Lexical scope: local declarations followed by statements
struct Block {
	std::vector <Type> locals;
	std::vector <Stmt> statements;
};

struct NestedBlock {
	Block block;
};

struct Assign {
	Expr dst;
	Expr src;
};

// Both branches are always emitted
struct If {
	Expr cond;
	Block then_block;
	Block else_block;
};

// Counted loop over a fresh integer local
//
//   init: initial counter value
//   limit: exclusive upper bound
//   step: nonzero increment
struct For {
	int init;
	int limit;
	int step;
	Block body;
};

struct Jump {
	JumpKind kind;
};

using stmt_base = wrapped::variant <
	NestedBlock,
	Assign,
	If,
	For,
	Jump
>;

struct Stmt : stmt_base {
	using stmt_base::stmt_base;
};

// Construction helpers
Stmt block_stmt(const Block &);
Stmt assign(const Expr &, const Expr &);
Stmt branch(const Expr &, const Block &, const Block & = {});
Stmt loop(int, int, int, const Block &);
Stmt jump(JumpKind);

} // namespace shir::ir
