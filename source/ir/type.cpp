#include <fmt/format.h>
#include <fmt/ranges.h>

#include "common/logging.hpp"
#include "ir/type.hpp"

namespace shir::ir {

MODULE(type);

bool Type::operator==(const Type &other) const
{
	return (main == other.main) && (sub == other.sub);
}

std::string Type::to_string() const
{
	if (main < 0 || main >= __pt_end)
		return fmt::format("<type:{}>", (int) main);

	if (main != structure)
		return tbl_primitive_types[main];

	std::vector <std::string> members;
	for (auto &t : sub)
		members.push_back(t.to_string());

	return fmt::format("struct {{ {} }}", fmt::join(members, ", "));
}

std::string variable_name(VariableCategory category, int index)
{
	if (category < 0 || category >= __vc_end)
		SHIR_ABORT("unknown variable category #{}", (int) category);

	return fmt::format("{}{}", tbl_variable_category[category], index);
}

} // namespace shir::ir
