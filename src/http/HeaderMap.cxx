// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HeaderMap.hxx"

#include <algorithm>

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? ch + ('a' - 'A')
		: ch;
}

[[gnu::pure]]
static bool
IsLowerCase(std::string_view s) noexcept
{
	return std::none_of(s.begin(), s.end(), [](char ch){
		return ch >= 'A' && ch <= 'Z';
	});
}

static std::string
ToLowerASCII(std::string_view s)
{
	std::string result;
	result.reserve(s.size());
	for (char ch : s)
		result.push_back(ToLowerASCII(ch));
	return result;
}

void
HeaderMap::Set(std::string_view name, std::string_view value)
{
	auto key = ToLowerASCII(name);
	auto i = map.find(key);
	if (i != map.end())
		i->second.assign(value);
	else
		map.emplace(std::move(key), value);
}

void
HeaderMap::Remove(std::string_view name) noexcept
{
	if (IsLowerCase(name)) {
		auto i = map.find(name);
		if (i != map.end())
			map.erase(i);
		return;
	}

	auto i = std::find_if(map.begin(), map.end(), [name](const auto &item){
		return std::equal(name.begin(), name.end(),
				  item.first.begin(), item.first.end(),
				  [](char a, char b){
					  return ToLowerASCII(a) == b;
				  });
	});
	if (i != map.end())
		map.erase(i);
}

const char *
HeaderMap::Get(std::string_view name) const noexcept
{
	if (IsLowerCase(name)) {
		auto i = map.find(name);
		return i != map.end()
			? i->second.c_str()
			: nullptr;
	}

	for (const auto &[key, value] : map)
		if (std::equal(name.begin(), name.end(),
			       key.begin(), key.end(),
			       [](char a, char b){
				       return ToLowerASCII(a) == b;
			       }))
			return value.c_str();

	return nullptr;
}
