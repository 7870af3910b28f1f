// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>

/**
 * A map of HTTP header names to values.  Names are case-insensitive;
 * they are stored in lower case.  Each name has at most one value.
 */
class HeaderMap {
	using Map = std::map<std::string, std::string, std::less<>>;
	Map map;

public:
	using const_iterator = Map::const_iterator;

	HeaderMap() = default;

	HeaderMap(std::initializer_list<std::pair<std::string_view, std::string_view>> init) {
		for (const auto &i : init)
			Set(i.first, i.second);
	}

	const_iterator begin() const noexcept {
		return map.begin();
	}

	const_iterator end() const noexcept {
		return map.end();
	}

	[[gnu::pure]]
	bool IsEmpty() const noexcept {
		return map.empty();
	}

	void Clear() noexcept {
		map.clear();
	}

	/**
	 * Replace the value of the given header (or add it).
	 */
	void Set(std::string_view name, std::string_view value);

	void Remove(std::string_view name) noexcept;

	/**
	 * @return the value or nullptr if the header does not exist
	 */
	[[gnu::pure]]
	const char *Get(std::string_view name) const noexcept;

	[[gnu::pure]]
	bool Contains(std::string_view name) const noexcept {
		return Get(name) != nullptr;
	}
};
