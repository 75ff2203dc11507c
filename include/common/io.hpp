#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace shir::io {

////////////////////////
// Printing utilities //
////////////////////////

// Boxed headers
void header(const std::string &title, size_t size, bool source = false);

// Line splitting, without the empty tail after a final newline
std::vector <std::string> split_lines(const std::string &content);

// Displaying generated source code
void display_lines(const std::string &title, const std::string &content, bool source = false);

void write_lines(const std::filesystem::path &path, const std::string &content);

} // namespace shir::io
