// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FileLineParser.hxx"

std::filesystem::path
FileLineParser::ExpectPath()
{
	const char *value = NextUnescape();
	if (value == nullptr || *value == 0)
		throw Error("Path expected");

	std::filesystem::path path{value};
	if (path.is_relative())
		path = base_path.parent_path() / path;

	/* "." and ".." segments would confuse the netns name
	   lookup */
	return path.lexically_normal();
}

std::filesystem::path
FileLineParser::ExpectPathAndEnd()
{
	auto value = ExpectPath();
	ExpectEnd();
	return value;
}
