#pragma once

#include <optional>
#include <unordered_map>
#include <variant>

// Wrappers on standard types
namespace shir::wrapped {

// Simpler variant type
template <typename ... Args>
struct variant : std::variant <Args...> {
	using std::variant <Args...> ::variant;

	template <typename T>
	inline bool is() const {
		return std::holds_alternative <T> (*this);
	}

	template <typename T>
	inline auto &as() {
		return std::get <T> (*this);
	}

	template <typename T>
	inline const auto &as() const {
		return std::get <T> (*this);
	}

	template <typename T>
	inline const T *get() const {
		return std::get_if <T> (this);
	}
};

// Optional returns for hash tables
template <typename K, typename V>
struct hash_table : std::unordered_map <K, V> {
	using std::unordered_map <K, V> ::unordered_map;

	std::optional <V> get(const K &k) const {
		if (this->count(k))
			return this->at(k);

		return std::nullopt;
	}
};

} // namespace shir::wrapped
