// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <string>

#include <string.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

static constexpr std::size_t MAX_CONFIG_FILE_SIZE = 1024 * 1024;

static std::string
ReadConfigFile(const std::filesystem::path &path)
{
	const auto fd = OpenReadOnly(path.c_str());

	std::string contents;
	char buffer[4096];

	while (true) {
		ssize_t nbytes = fd.Read(buffer, sizeof(buffer));
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", path.native());

		if (nbytes == 0)
			return contents;

		contents.append(buffer, nbytes);
		if (contents.size() > MAX_CONFIG_FILE_SIZE)
			throw std::runtime_error(fmt::format("File is too large: {}"sv,
							     path.native()));
	}
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	std::string contents = ReadConfigFile(path);

	char *p = contents.data();
	unsigned i = 1;

	while (*p != 0) {
		char *line = p;
		char *newline = strchr(p, '\n');
		if (newline != nullptr) {
			*newline = 0;
			p = newline + 1;
		} else
			p += strlen(p);

		FileLineParser line_parser(path, line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		++i;
	}

	parser.Finish();
}
