// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Reference.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <limits.h> // for PATH_MAX

using std::string_view_literals::operator""sv;

static std::string
CheckPath(std::string_view path)
{
	if (path.size() >= PATH_MAX)
		throw std::invalid_argument{"Network namespace path is too long"};

	return std::string{path};
}

std::string
ResolveNetnsReference(std::string_view reference,
		      std::string_view netns_directory)
{
	if (reference.empty())
		throw std::invalid_argument{"Empty network namespace reference"};

	if (reference.starts_with("file://"sv)) {
		reference.remove_prefix(7);
		if (!reference.starts_with('/'))
			throw std::invalid_argument{"Network namespace URL without absolute path"};

		return CheckPath(reference);
	}

	if (reference.find("://"sv) != reference.npos)
		throw std::invalid_argument{fmt::format("Unsupported network namespace URL: {}"sv,
							reference)};

	if (reference.starts_with('/'))
		return CheckPath(reference);

	if (reference.find('/') != reference.npos ||
	    reference == "."sv || reference == ".."sv)
		throw std::invalid_argument{fmt::format("Malformed network namespace name: {}"sv,
							reference)};

	std::string path{netns_directory};
	if (path.empty() || path.back() != '/')
		path.push_back('/');
	path.append(reference);
	return CheckPath(path);
}
