#pragma once

#include <chrono>
#include <string>

#include <fmt/color.h>
#include <fmt/format.h>

namespace shir::io {

void assertion(bool cond, const std::string &, const std::string &, const char *const, int);

[[noreturn]] void abort(const std::string &, const std::string &, const char *const, int);

void error(const std::string &, const std::string &);
void info(const std::string &, const std::string &);

struct stage_bracket {
	std::string module;

	using clock_t = std::chrono::high_resolution_clock;
	using time_t = clock_t::time_point;

	clock_t clk;
	time_t start;
	time_t end;

	stage_bracket(const std::string &);

	~stage_bracket();
};

// Helper macros for easier logging
#define MODULE(name) [[maybe_unused]] static constexpr const char __module__[] = #name

} // namespace shir::io

#ifdef SHIR_DEBUG

#define SHIR_ASSERT(cond, ...)	shir::io::assertion(cond, __module__, fmt::format(__VA_ARGS__), __FILE__, __LINE__)

#define SHIR_STAGE()		shir::io::stage_bracket __stage(__module__)

#else

#define SHIR_ASSERT(cond, ...)	if (cond && __module__) {}

#define SHIR_STAGE()

#endif

#define SHIR_ABORT(...)		shir::io::abort(__module__, fmt::format(__VA_ARGS__), __FILE__, __LINE__)
#define SHIR_ERROR(...)		shir::io::error(__module__, fmt::format(__VA_ARGS__))
#define SHIR_INFO(...)		shir::io::info(__module__, fmt::format(__VA_ARGS__))
