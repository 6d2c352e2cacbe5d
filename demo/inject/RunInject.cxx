// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "inject/Config.hxx"
#include "inject/Element.hxx"
#include "chain/Chain.hxx"
#include "chain/Connection.hxx"
#include "chain/Context.hxx"
#include "netns/LinuxProvider.hxx"
#include "netns/Worker.hxx"
#include "lib/cap/Glue.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"
#include "util/StringCompare.hxx"

#include <span>
#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>

struct Usage {};

static void
CheckCapabilities()
{
	if (!IsSysAdmin())
		throw std::runtime_error{"CAP_SYS_ADMIN is required"};

	if (!HaveNetAdmin())
		throw std::runtime_error{"CAP_NET_ADMIN is required"};
}

int
main(int argc, char **argv)
try {
	std::span<const char *const> args{argv + 1, static_cast<std::size_t>(argc - 1)};

	const char *config_path = nullptr;
	bool client = false, verbose = false;

	while (!args.empty() && args.front()[0] == '-') {
		const char *arg = args.front();
		args = args.subspan(1);

		if (const char *value = StringAfterPrefix(arg, "--config=")) {
			config_path = value;
		} else if (StringIsEqual(arg, "--client")) {
			client = true;
		} else if (StringIsEqual(arg, "--verbose")) {
			verbose = true;
		} else
			throw Usage{};
	}

	if (args.size() != 4)
		throw Usage{};

	const char *command = args[0];
	const bool is_request = StringIsEqual(command, "request");
	if (!is_request && !StringIsEqual(command, "close"))
		throw Usage{};

	InjectConfig config;
	if (config_path != nullptr)
		LoadConfigFile(config, config_path);

	SetLogLevel(verbose ? 3 : config.log_level);

	if (config.require_capabilities)
		CheckCapabilities();

	const Connection connection{
		.id = args[1],
		.mechanism = {
			.netns_url = args[2],
			.interface_name = args[3],
		},
	};

	LinuxNetnsProvider provider{config.netns_directory};
	NetnsWorker worker;

	ChainBuilder builder;
	auto &element = builder.Emplace<InjectElement>(provider, worker);
	const auto chain = builder.Build();

	Context ctx;
	if (client)
		ctx.role = Context::Role::CLIENT;

	if (is_request) {
		const auto result = chain->Request(ctx, connection);
		printf("%s\n", result.id.c_str());
	} else
		chain->Close(ctx, connection);

	const auto stats = element.GetStats();
	LogFmt(3, "inject", "relocations={} failed={} compensations={} failed_compensations={} unrecoverable={}",
	       stats.relocations, stats.failed_relocations,
	       stats.compensations, stats.failed_compensations,
	       stats.unrecoverable);

	return EXIT_SUCCESS;
} catch (Usage) {
	fprintf(stderr, "Usage: RunInject"
		" [--config=PATH] [--client] [--verbose]"
		" request|close CONNECTION_ID NETNS INTERFACE"
		"\n");
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
