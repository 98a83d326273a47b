// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <map>
#include <string>
#include <string_view>

/**
 * String multi map.  Keys are compared case-sensitively; callers
 * which need case-insensitive lookups (e.g. HTTP header names)
 * normalize keys to lower case before inserting.
 */
class StringMap {
	using Map = std::multimap<std::string, std::string, std::less<>>;
	Map map;

public:
	StringMap() noexcept = default;

	StringMap(std::initializer_list<std::pair<const std::string, std::string>> init)
		:map(init) {}

	using const_iterator = Map::const_iterator;

	const_iterator begin() const noexcept {
		return map.begin();
	}

	const_iterator end() const noexcept {
		return map.end();
	}

	bool empty() const noexcept {
		return map.empty();
	}

	void clear() noexcept {
		map.clear();
	}

	void Add(std::string_view key, std::string_view value);

	/**
	 * Remove all existing values with the specified key and
	 * insert the new value.
	 */
	void Set(std::string_view key, std::string_view value);

	/**
	 * @return the number of removed items
	 */
	std::size_t Remove(std::string_view key) noexcept;

	/**
	 * @return the first value with the given key or nullptr if
	 * there is none
	 */
	[[gnu::pure]]
	const char *Get(std::string_view key) const noexcept;

	[[gnu::pure]]
	bool Contains(std::string_view key) const noexcept {
		return map.find(key) != map.end();
	}
};
