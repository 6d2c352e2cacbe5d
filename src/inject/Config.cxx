// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "io/config/FileLineParser.hxx"
#include "util/StringCompare.hxx"

void
InjectConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "netns_directory")) {
		config.netns_directory = line.ExpectPathAndEnd().native();
	} else if (StringIsEqual(word, "log_level")) {
		config.log_level = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "require_capabilities")) {
		config.require_capabilities = line.NextBool();
		line.ExpectEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
InjectConfigParser::Finish()
{
	if (config.netns_directory.empty())
		throw LineParser::Error("netns_directory must not be empty");

	ConfigParser::Finish();
}

void
LoadConfigFile(InjectConfig &config, const char *path)
{
	InjectConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);
}
