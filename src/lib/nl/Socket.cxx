// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Socket.hxx"
#include "Error.hxx"

#include <netlink/netlink.h>
#include <netlink/socket.h>

#include <new>

NetlinkSocket::NetlinkSocket(int protocol)
	:sock(nl_socket_alloc())
{
	if (sock == nullptr)
		throw std::bad_alloc{};

	if (int err = nl_connect(sock, protocol); err < 0) {
		nl_socket_free(sock);
		throw NetlinkError(err, "Failed to connect netlink socket");
	}
}

NetlinkSocket::~NetlinkSocket() noexcept
{
	nl_socket_free(sock);
}
