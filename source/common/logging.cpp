#include <cstdio>

#include "common/logging.hpp"

namespace shir::io {

static void prefix(const std::string &module)
{
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gray), "shir ");
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gray), "({}): ", module);
}

static void declared_from(const char *const file, int line)
{
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gray), "shir: ");
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::cadet_blue), "note: ");
	fmt::print("declared from {}:{}\n", file, line);
}

void assertion(bool cond, const std::string &module, const std::string &msg, const char *const file, int line)
{
	if (cond) return;
	prefix(module);
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::purple), "assertion failed: ");
	fmt::print("{}\n", msg);
	declared_from(file, line);
	std::fflush(stdout);
	__builtin_trap();
}

[[noreturn]]
void abort(const std::string &module, const std::string &msg, const char *const file, int line)
{
	prefix(module);
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::orange_red), "fatal error: ");
	fmt::print("{}\n", msg);
	declared_from(file, line);
	std::fflush(stdout);
	__builtin_trap();
}

void error(const std::string &module, const std::string &msg)
{
	prefix(module);
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::orange_red), "error: ");
	fmt::print("{}\n", msg);
	std::fflush(stdout);
}

void info(const std::string &module, const std::string &msg)
{
	prefix(module);
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::cadet_blue), "info: ");
	fmt::print("{}\n", msg);
	std::fflush(stdout);
}

stage_bracket::stage_bracket(const std::string &module_) : module(module_)
{
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gray), "shir: ");
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gold), "begin: ");
	fmt::print(fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::gray), "{}\n", module);
	std::fflush(stdout);

	start = clk.now();
}

stage_bracket::~stage_bracket()
{
	end = clk.now();

	auto us = std::chrono::duration_cast <std::chrono::microseconds> (end - start).count();
	auto ms = us/1000.0;

	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gray), "shir: ");
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gold), "close: ");
	fmt::print(fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::gray), "{}", module);
	fmt::print(fmt::emphasis::bold | fmt::fg(fmt::color::gray), " ({} ms)\n", ms);
	std::fflush(stdout);
}

} // namespace shir::io
