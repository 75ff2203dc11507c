#include <cstdio>

#include <fmt/format.h>

#include "common/io.hpp"
#include "common/logging.hpp"

namespace shir::io {

MODULE(io);

static std::string repeat(const std::string &a, size_t b)
{
	std::string output;
	while (b--)
		output += a;

	return output;
}

void header(const std::string &title, size_t size, bool source)
{
	std::string s1 = "┌" + repeat("─", size - 2) + "┐";
	std::string s2 = "└" + repeat("─", size - 2) + "┘";
	std::string s3 = std::string((size - 2 - title.size()) / 2, ' ');
	std::string s4 = std::string((size - 2 - title.size()) - s3.size(), ' ');

	if (source) {
		fmt::print("// {}\n", s1);
		fmt::print("// {}{}{}{}{}\n", "│", s3, title, s4, "│");
		fmt::print("// {}\n", s2);
	} else {
		fmt::print("{}\n", s1);
		fmt::print("{}{}{}{}{}\n", "│", s3, title, s4, "│");
		fmt::print("{}\n", s2);
	}
}

std::vector <std::string> split_lines(const std::string &content)
{
	std::vector <std::string> lines;
	lines.emplace_back("");

	for (auto c : content) {
		if (c == '\n')
			lines.emplace_back("");
		else
			lines.back() += c;
	}

	if (lines.back().empty())
		lines.pop_back();

	return lines;
}

void display_lines(const std::string &title, const std::string &content, bool source)
{
	auto lines = split_lines(content);

	header(title, 50, source);

	if (source) {
		for (size_t i = 0; i < lines.size(); i++)
			fmt::print("{}\n", lines[i]);
	} else {
		for (size_t i = 0; i < lines.size(); i++)
			fmt::print("{:4d}: {}\n", i + 1, lines[i]);
	}
}

void write_lines(const std::filesystem::path &path, const std::string &content)
{
	auto lines = split_lines(content);

	FILE *fout = fopen(path.c_str(), "w");
	if (!fout)
		SHIR_ABORT("failed to open file '{}'", path.string());

	for (size_t i = 0; i < lines.size(); i++)
		fmt::print(fout, "{}\n", lines[i]);

	fclose(fout);
}

} // namespace shir::io
