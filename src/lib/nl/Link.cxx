// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Link.hxx"
#include "Error.hxx"

#include <fmt/core.h>

#include <new>

using std::string_view_literals::operator""sv;

UniqueRtnlLink
GetKernelLink(struct nl_sock *sock, int ifindex, const char *name)
{
	struct rtnl_link *link;
	if (int err = rtnl_link_get_kernel(sock, ifindex, name, &link); err < 0) {
		if (name != nullptr)
			throw NetlinkError(err, fmt::format("Failed to look up link '{}'"sv,
							    name));

		throw NetlinkError(err, fmt::format("Failed to look up link #{}"sv,
						    ifindex));
	}

	return UniqueRtnlLink{link};
}

UniqueRtnlLink
AllocRtnlLink()
{
	struct rtnl_link *link = rtnl_link_alloc();
	if (link == nullptr)
		throw std::bad_alloc{};

	return UniqueRtnlLink{link};
}
