// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <netlink/route/link.h>

#include <memory>

struct RtnlLinkDeleter {
	void operator()(struct rtnl_link *link) const noexcept {
		rtnl_link_put(link);
	}
};

/**
 * An owned reference to a libnl link object.
 */
using UniqueRtnlLink = std::unique_ptr<struct rtnl_link, RtnlLinkDeleter>;

/**
 * Query the kernel for a link by index or name.
 *
 * Throws #NetlinkError on error.
 *
 * @param ifindex the interface index or 0 to look up by name
 * @param name the interface name or nullptr to look up by index
 */
UniqueRtnlLink
GetKernelLink(struct nl_sock *sock, int ifindex, const char *name);

/**
 * Allocate an empty link object, to be used as a change request.
 *
 * Throws std::bad_alloc on error.
 */
UniqueRtnlLink
AllocRtnlLink();
