// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "LineParser.hxx"

#include <filesystem>

/**
 * A #LineParser which knows the path of the file being parsed, to
 * resolve relative paths.
 */
class FileLineParser : public LineParser {
	const std::filesystem::path &base_path;

public:
	FileLineParser(const std::filesystem::path &_base_path, char *_p)
		:LineParser(_p), base_path(_base_path) {}

	/**
	 * Parse a non-empty path value.  Relative paths are
	 * interpreted relative to the directory containing the file
	 * being parsed, and the result is lexically normalized.
	 *
	 * Throws #LineParser::Error on error.
	 */
	std::filesystem::path ExpectPath();
	std::filesystem::path ExpectPathAndEnd();
};
