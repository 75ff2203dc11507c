#pragma once

#include <string>
#include <vector>

#include "expression.hpp"
#include "program.hpp"
#include "statement.hpp"
#include "type.hpp"

namespace shir::ir::detail {

template <typename T>
constexpr bool unhandled_kind = false;

// Struct names and definitions, shared across a program
struct glsl_struct_table_t {
	std::vector <Type> types;
	std::string definitions;

	std::string struct_name(const Type &);
	std::string type_to_string(const Type &);
};

std::string generate_operation(OperationCode, const std::string &);
std::string generate_operation(OperationCode, const std::string &, const std::string &);

struct glsl_generator_t {
	const Program &program;
	glsl_struct_table_t &structs;
	const Func &func;

	int locals;
	size_t indentation;
	std::string source;

	glsl_generator_t(const Program &, glsl_struct_table_t &, const Func &);

	void finish(const std::string &, bool = true);

	std::string allocate();
	void declare(const Type &);

	std::string reference(const Variable &) const;

	std::string inlined(const Expr &) const;
	std::string inlined(const Numeric &) const;
	std::string inlined(const VariableReference &) const;
	std::string inlined(const Unary &) const;
	std::string inlined(const Binary &) const;

	void generate_block(const Block &);
	void generate_statement(const Stmt &);

	// Per-statement generator
	template <typename T>
	void generate(const T &) {
		static_assert(unhandled_kind <T>, "no GLSL generator for statement kind");
	}

	// Signature and body of the function
	std::string generate();
};

} // namespace shir::ir::detail
