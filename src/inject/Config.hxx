// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/config/ConfigParser.hxx"

#include <string>

struct InjectConfig {
	/**
	 * Network namespace references without a slash are names in
	 * this directory.
	 */
	std::string netns_directory = "/run/netns";

	unsigned log_level = 1;

	/**
	 * Check for CAP_SYS_ADMIN and CAP_NET_ADMIN at startup?
	 */
	bool require_capabilities = true;
};

/**
 * Parse lines of an #InjectConfig file.  Wrap it in a
 * #CommentConfigParser to allow comments and empty lines.
 */
class InjectConfigParser final : public ConfigParser {
	InjectConfig &config;

public:
	explicit InjectConfigParser(InjectConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * Load an #InjectConfig from the given file.
 *
 * Throws on error.
 */
void
LoadConfigFile(InjectConfig &config, const char *path);
