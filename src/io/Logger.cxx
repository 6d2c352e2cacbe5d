// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

void
LoggerDetail::Write(std::string_view domain, std::string_view msg) noexcept
{
	fmt::memory_buffer buffer;

	if (!domain.empty())
		fmt::format_to(std::back_inserter(buffer), "[{}] ", domain);

	buffer.append(msg.data(), msg.data() + msg.size());
	buffer.push_back('\n');

	/* a single write() per line */
	ssize_t nbytes = write(STDERR_FILENO, buffer.data(), buffer.size());
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	char buffer[1024];
	const auto result = fmt::vformat_to_n(buffer, sizeof(buffer),
					      format_str, args);
	Write(domain, {buffer, std::min(result.size, sizeof(buffer))});
}

std::string
ChildLoggerDomain::Make(std::string_view parent, const char *name) noexcept
{
	if (parent.empty())
		return name;

	return std::string{parent} + '/' + name;
}
