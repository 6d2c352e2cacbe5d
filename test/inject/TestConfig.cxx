// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "inject/Config.hxx"
#include "io/config/FileLineParser.hxx"
#include "util/ScopeExit.hxx"

#include <gtest/gtest.h>

#include <system_error>

#include <string.h>
#include <stdlib.h>

static void
ParseConfigLines(ConfigParser &parser, const char *const*lines)
{
	const std::filesystem::path base{"/etc/ifinject/ifinject.conf"};

	while (*lines != nullptr) {
		char *line = strdup(*lines++);
		AtScopeExit(line) { free(line); };

		FileLineParser line_parser(base, line);
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	}

	parser.Finish();
}

static InjectConfig
ParseInjectConfig(const char *const*lines)
{
	InjectConfig config;
	InjectConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigLines(comment_parser, lines);
	return config;
}

TEST(InjectConfig, Defaults)
{
	static const char *const lines[] = {
		"# nothing",
		nullptr
	};

	const auto config = ParseInjectConfig(lines);
	EXPECT_EQ(config.netns_directory, "/run/netns");
	EXPECT_EQ(config.log_level, 1U);
	EXPECT_TRUE(config.require_capabilities);
}

TEST(InjectConfig, Options)
{
	static const char *const lines[] = {
		"netns_directory \"/var/run/netns\"",
		"log_level 3",
		"",
		"require_capabilities no",
		nullptr
	};

	const auto config = ParseInjectConfig(lines);
	EXPECT_EQ(config.netns_directory, "/var/run/netns");
	EXPECT_EQ(config.log_level, 3U);
	EXPECT_FALSE(config.require_capabilities);
}

TEST(InjectConfig, RelativeDirectory)
{
	static const char *const lines[] = {
		"netns_directory netns",
		nullptr
	};

	const auto config = ParseInjectConfig(lines);
	EXPECT_EQ(config.netns_directory, "/etc/ifinject/netns");
}

TEST(InjectConfig, NormalizedDirectory)
{
	static const char *const relative[] = {
		"netns_directory ./run/../netns",
		nullptr
	};

	EXPECT_EQ(ParseInjectConfig(relative).netns_directory,
		  "/etc/ifinject/netns");

	static const char *const absolute[] = {
		"netns_directory /var/run/./netns",
		nullptr
	};

	EXPECT_EQ(ParseInjectConfig(absolute).netns_directory,
		  "/var/run/netns");
}

TEST(InjectConfig, Errors)
{
	static const char *const unknown[] = {
		"foo bar",
		nullptr
	};

	EXPECT_THROW(ParseInjectConfig(unknown), LineParser::Error);

	static const char *const bad_bool[] = {
		"require_capabilities maybe",
		nullptr
	};

	EXPECT_THROW(ParseInjectConfig(bad_bool), LineParser::Error);

	static const char *const trailing[] = {
		"log_level 2 3",
		nullptr
	};

	EXPECT_THROW(ParseInjectConfig(trailing), LineParser::Error);

	static const char *const empty_directory[] = {
		"netns_directory \"\"",
		nullptr
	};

	EXPECT_THROW(ParseInjectConfig(empty_directory), LineParser::Error);
}

TEST(InjectConfig, FileNotFound)
{
	InjectConfig config;
	EXPECT_THROW(LoadConfigFile(config, "/nonexistent/ifinject.conf"),
		     std::system_error);
}
