// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

struct nl_sock;

/**
 * OO wrapper for a connected libnl socket.
 *
 * A netlink socket operates in the network namespace which was
 * current on the thread which created it.
 */
class NetlinkSocket {
	struct nl_sock *sock;

public:
	/**
	 * Allocate and connect a socket.
	 *
	 * Throws #NetlinkError on error.
	 *
	 * @param protocol e.g. NETLINK_ROUTE
	 */
	explicit NetlinkSocket(int protocol);

	~NetlinkSocket() noexcept;

	NetlinkSocket(const NetlinkSocket &) = delete;
	NetlinkSocket &operator=(const NetlinkSocket &) = delete;

	struct nl_sock *get() const noexcept {
		return sock;
	}
};
