// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LinuxProvider.hxx"
#include "Reference.hxx"
#include "lib/nl/Error.hxx"
#include "lib/nl/Link.hxx"
#include "lib/nl/Socket.hxx"
#include "lib/fmt/SystemError.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <fmt/core.h>

#include <linux/netlink.h> // for NETLINK_ROUTE

#include <sched.h> // for setns()
#include <sys/stat.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

UniqueNetnsHandle
LinuxNetnsProvider::GetCurrent()
{
	/* "thread-self", not "self": namespace membership is per
	   thread */
	auto fd = OpenReadOnly("/proc/thread-self/ns/net");
	return {*this, NetnsHandle{fd.Release().Get()}};
}

UniqueNetnsHandle
LinuxNetnsProvider::Open(const char *reference)
{
	const auto path = ResolveNetnsReference(reference, netns_directory);
	auto fd = OpenReadOnly(path.c_str());
	return {*this, NetnsHandle{fd.Release().Get()}};
}

bool
LinuxNetnsProvider::Equals(NetnsHandle a, NetnsHandle b) const noexcept
{
	struct stat sa, sb;
	if (fstat(a.Get(), &sa) < 0 || fstat(b.Get(), &sb) < 0)
		return false;

	return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}

void
LinuxNetnsProvider::SetCurrent(NetnsHandle handle)
{
	if (setns(handle.Get(), CLONE_NEWNET) < 0)
		throw FmtErrno("setns({}) failed", handle.Get());
}

InterfaceRef
LinuxNetnsProvider::FindInterface(const char *name)
{
	/* a new socket for each call: it must live in the namespace
	   which is current right now */
	const NetlinkSocket socket{NETLINK_ROUTE};
	const auto link = GetKernelLink(socket.get(), 0, name);

	return {
		static_cast<unsigned>(rtnl_link_get_ifindex(link.get())),
		name,
	};
}

void
LinuxNetnsProvider::MoveInterface(const InterfaceRef &interface,
				  NetnsHandle destination)
{
	const NetlinkSocket socket{NETLINK_ROUTE};
	const auto orig = GetKernelLink(socket.get(), interface.index, nullptr);

	const auto change = AllocRtnlLink();
	rtnl_link_set_ns_fd(change.get(), destination.Get());

	if (int err = rtnl_link_change(socket.get(), orig.get(), change.get(), 0);
	    err < 0)
		throw NetlinkError(err, fmt::format("Failed to move link '{}' to another namespace"sv,
						    interface.name));
}

bool
LinuxNetnsProvider::Release(NetnsHandle handle) noexcept
{
	return close(handle.Get()) == 0;
}
