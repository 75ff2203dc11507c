#include <algorithm>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "common/logging.hpp"
#include "ir/glsl_generator.hpp"

namespace shir::ir::detail {

MODULE(glsl-generator);

std::string glsl_struct_table_t::struct_name(const Type &type)
{
	auto it = std::find(types.begin(), types.end(), type);
	if (it != types.end())
		return fmt::format("S{}", std::distance(types.begin(), it));

	if (type.sub.empty())
		SHIR_ABORT("struct type has no members: {}", type.to_string());

	// Nested structs are named and defined first
	std::vector <std::string> members;
	for (auto &t : type.sub)
		members.push_back(type_to_string(t));

	std::string name = fmt::format("S{}", types.size());
	types.push_back(type);

	definitions += fmt::format("struct {} {{\n", name);
	for (size_t i = 0; i < members.size(); i++)
		definitions += fmt::format("\t{} M{};\n", members[i], i);

	definitions += "};\n";

	return name;
}

std::string glsl_struct_table_t::type_to_string(const Type &type)
{
	switch (type.main) {
	case f32:
	case vec2:
	case vec3:
	case vec4:
	case mat2:
	case mat3:
	case mat4:
		return tbl_primitive_types[type.main];

	case structure:
		return struct_name(type);

	default:
		break;
	}

	SHIR_ABORT("failed to resolve type name for {}", type.to_string());
}

std::string generate_operation(OperationCode code, const std::string &a)
{
	static const wrapped::hash_table <OperationCode, const char *> operators {
		{ negation,	"-" },
		{ bool_not,	"!" },
	};

	auto op = operators.get(code);
	if (!op) {
		SHIR_ABORT("no unary operator symbol found for $({})",
			(code >= 0 && code < __oc_end) ? tbl_operation_code[code] : "?");
	}

	return fmt::format("{}({})", op.value(), a);
}

std::string generate_operation(OperationCode code, const std::string &a, const std::string &b)
{
	// Binary operator strings
	static const wrapped::hash_table <OperationCode, const char *> operators {
		{ addition,		"+" },
		{ subtraction,		"-" },
		{ multiplication,	"*" },
		{ division,		"/" },

		{ modulus,		"%" },

		{ bit_shift_left,	"<<" },
		{ bit_shift_right,	">>" },

		{ bit_and,		"&" },
		{ bit_xor,		"^" },
		{ bit_or,		"|" },

		{ bool_and,		"&&" },
		{ bool_or,		"||" },

		{ less_than,		"<" },
		{ less_equal,		"<=" },
		{ greater_than,		">" },
		{ greater_equal,	">=" },
		{ equals,		"==" },
		{ not_equals,		"!=" },
	};

	auto op = operators.get(code);
	if (!op) {
		SHIR_ABORT("no binary operator symbol found for $({})",
			(code >= 0 && code < __oc_end) ? tbl_operation_code[code] : "?");
	}

	return fmt::format("({}) {} ({})", a, op.value(), b);
}

glsl_generator_t::glsl_generator_t(const Program &program_, glsl_struct_table_t &structs_, const Func &func_)
		: program(program_), structs(structs_), func(func_), locals(0), indentation(1) {}

void glsl_generator_t::finish(const std::string &s, bool semicolon)
{
	source += std::string(indentation, '\t') + s + (semicolon ? ";" : "") + "\n";
}

std::string glsl_generator_t::allocate()
{
	return variable_name(local, locals++);
}

void glsl_generator_t::declare(const Type &type)
{
	auto t = structs.type_to_string(type);
	finish(fmt::format("{} {}", t, allocate()));
}

std::string glsl_generator_t::reference(const Variable &var) const
{
	size_t count = 0;
	switch (var.category) {
	case uniform:
		count = program.uniforms.size();
		break;
	case attribute:
		count = program.attributes.size();
		break;
	case varying:
		count = program.varyings.size();
		break;
	case local:
		count = locals;
		break;
	default:
		SHIR_ABORT("unknown variable category #{}", (int) var.category);
	}

	if (var.index < 0 || (size_t) var.index >= count) {
		SHIR_ABORT("reference to {} is out of range in {} ({} assigned)",
			variable_name(var.category, var.index), func.name, count);
	}

	return variable_name(var.category, var.index);
}

std::string glsl_generator_t::inlined(const Expr &expr) const
{
	auto ftn = [&](const auto &e) { return inlined(e); };
	return std::visit(ftn, expr);
}

std::string glsl_generator_t::inlined(const Numeric &numeric) const
{
	return fmt::format("{:.9e}", numeric.value);
}

std::string glsl_generator_t::inlined(const VariableReference &ref) const
{
	return reference(ref.variable);
}

std::string glsl_generator_t::inlined(const Unary &unary) const
{
	SHIR_ASSERT(unary.a != nullptr, "unary operation without an operand");

	return generate_operation(unary.code, inlined(*unary.a));
}

std::string glsl_generator_t::inlined(const Binary &binary) const
{
	SHIR_ASSERT(binary.a != nullptr && binary.b != nullptr,
		"binary operation without both operands");

	return generate_operation(binary.code, inlined(*binary.a), inlined(*binary.b));
}

// Generators for each kind of statement
template <>
void glsl_generator_t::generate(const NestedBlock &nested)
{
	finish("{", false);
	indentation++;
	generate_block(nested.block);
	indentation--;
	finish("}", false);
}

template <>
void glsl_generator_t::generate(const Assign &assign)
{
	finish(fmt::format("{} = {}", inlined(assign.dst), inlined(assign.src)));
}

template <>
void glsl_generator_t::generate(const If &branch)
{
	finish(fmt::format("if ({}) {{", inlined(branch.cond)), false);
	indentation++;
	generate_block(branch.then_block);
	indentation--;

	finish("} else {", false);
	indentation++;
	generate_block(branch.else_block);
	indentation--;

	finish("}", false);
}

template <>
void glsl_generator_t::generate(const For &loop)
{
	if (loop.step == 0)
		SHIR_ABORT("for loop in {} has a zero step", func.name);

	std::string counter = allocate();

	std::string increment;
	if (loop.step == 1)
		increment = "++";
	else if (loop.step == -1)
		increment = "--";
	else
		increment = fmt::format(" += {}", loop.step);

	finish(fmt::format("for (int {0} = {1}; {0} < {2}; {0}{3}) {{",
		counter, loop.init, loop.limit, increment), false);

	indentation++;
	generate_block(loop.body);
	indentation--;

	finish("}", false);
}

template <>
void glsl_generator_t::generate(const Jump &jump)
{
	if (jump.kind < 0 || jump.kind >= __jk_end)
		SHIR_ABORT("unknown jump kind #{}", (int) jump.kind);

	finish(tbl_jump_kind[jump.kind]);
}

void glsl_generator_t::generate_statement(const Stmt &stmt)
{
	auto ftn = [&](const auto &s) { return generate(s); };
	return std::visit(ftn, stmt);
}

void glsl_generator_t::generate_block(const Block &block)
{
	for (auto &type : block.locals)
		declare(type);

	for (auto &stmt : block.statements)
		generate_statement(stmt);
}

std::string glsl_generator_t::generate()
{
	std::vector <std::string> parameters;
	for (auto &type : func.in_params)
		parameters.push_back(fmt::format("in {} {}", structs.type_to_string(type), allocate()));
	for (auto &type : func.inout_params)
		parameters.push_back(fmt::format("inout {} {}", structs.type_to_string(type), allocate()));
	for (auto &type : func.out_params)
		parameters.push_back(fmt::format("out {} {}", structs.type_to_string(type), allocate()));

	std::string signature = "void";
	if (parameters.size())
		signature = fmt::format("{}", fmt::join(parameters, ", "));

	source = fmt::format("void {}({}) {{\n", func.name, signature);

	generate_block(func.block);

	source += "}\n";

	return source;
}

} // namespace shir::ir::detail
