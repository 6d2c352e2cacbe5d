// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Element.hxx"
#include "chain/Connection.hxx"
#include "chain/Context.hxx"
#include "netns/Error.hxx"
#include "netns/Relocate.hxx"
#include "netns/Switcher.hxx"
#include "netns/UniqueHandle.hxx"
#include "netns/Worker.hxx"
#include "util/Exception.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

static void
CheckInterfaceName(const Connection &connection)
{
	if (connection.mechanism.interface_name.empty())
		throw AcquisitionError{fmt::format("No interface name in connection '{}'"sv,
						   connection.id)};
}

/**
 * Rethrow the exception currently being handled, which was thrown by
 * the successor.  Errors of this library are passed through as-is,
 * others are wrapped in #DelegationError.
 */
[[noreturn]]
static void
RethrowDownstreamError(const char *operation, const Connection &connection)
{
	try {
		throw;
	} catch (const InjectError &) {
		throw;
	} catch (...) {
		std::throw_with_nested(DelegationError{fmt::format("{} failed downstream for connection '{}'"sv,
								   operation, connection.id)});
	}
}

template<typename L>
static void
ReleaseNamespace(const L &log, UniqueNetnsHandle &handle,
		 const char *which) noexcept
{
	if (handle.IsDefined() && !handle.Release())
		log.Fmt(1, "failed to release {} network namespace handle"sv,
			which);
}

static constexpr const char *
GetDestinationName(bool into_peer) noexcept
{
	return into_peer ? "the client's" : "the home";
}

InjectStats
InjectElement::GetStats() const noexcept
{
	constexpr auto order = std::memory_order_relaxed;

	return {
		.requests = counters.requests.load(order),
		.closes = counters.closes.load(order),
		.relocations = counters.relocations.load(order),
		.failed_relocations = counters.failed_relocations.load(order),
		.compensations = counters.compensations.load(order),
		.failed_compensations = counters.failed_compensations.load(order),
		.unrecoverable = counters.unrecoverable.load(order),
	};
}

UniqueNetnsHandle
InjectElement::OpenPeerNamespace(const Connection &connection)
{
	const auto &reference = connection.mechanism.netns_url;
	if (reference.empty())
		throw AcquisitionError{fmt::format("No network namespace in connection '{}'"sv,
						   connection.id)};

	try {
		return provider.Open(reference.c_str());
	} catch (...) {
		std::throw_with_nested(AcquisitionError{fmt::format("Failed to open network namespace '{}'"sv,
								    reference)});
	}
}

UniqueNetnsHandle
InjectElement::CaptureHomeNamespace()
{
	UniqueNetnsHandle home;

	try {
		worker.Run([this, &home]{
			home = provider.GetCurrent();
		});
	} catch (...) {
		std::throw_with_nested(AcquisitionError{"Failed to obtain the home network namespace"});
	}

	return home;
}

InjectElement::Namespaces
InjectElement::OpenNamespaces(const Connection &connection)
{
	Namespaces ns;
	ns.peer = OpenPeerNamespace(connection);
	ns.home = CaptureHomeNamespace();
	return ns;
}

void
InjectElement::Relocate(const char *interface_name, const Namespaces &ns,
			Direction direction)
{
	const NetnsHandle home = ns.home.Get(), peer = ns.peer.Get();

	worker.Run([this, interface_name, home, peer, direction]{
		NetnsSwitcher switcher{provider, home};

		if (direction == Direction::INTO_PEER)
			MoveInterface(switcher, interface_name, home, peer);
		else
			MoveInterface(switcher, interface_name, peer, home);
	});
}

template<typename L>
void
InjectElement::Relocate(const L &log, const Connection &connection,
			const Namespaces &ns, Direction direction)
{
	const char *interface_name = connection.mechanism.interface_name.c_str();
	const char *destination = GetDestinationName(direction == Direction::INTO_PEER);

	++counters.relocations;

	try {
		Relocate(interface_name, ns, direction);
	} catch (const UnrecoverableStateError &e) {
		++counters.failed_relocations;
		++counters.unrecoverable;
		log.Fmt(1, "worker thread torn down while moving network interface '{}' for connection '{}'"sv,
			interface_name, connection.id);
		e.ThrowNested(fmt::format("Failed to move network interface '{}' into {} namespace"sv,
					  interface_name, destination));
	} catch (const InjectError &e) {
		++counters.failed_relocations;
		e.ThrowNested(fmt::format("Failed to move network interface '{}' into {} namespace"sv,
					  interface_name, destination));
	} catch (...) {
		++counters.failed_relocations;
		throw;
	}

	log.Fmt(2, "moved network interface '{}' into {} namespace for connection '{}'"sv,
		interface_name, destination, connection.id);
}

template<typename L>
void
InjectElement::Compensate(const L &log, const Connection &connection,
			  const Namespaces &ns) noexcept
{
	const char *interface_name = connection.mechanism.interface_name.c_str();

	++counters.compensations;

	try {
		Relocate(interface_name, ns, Direction::BACK_HOME);
	} catch (const UnrecoverableStateError &) {
		++counters.failed_compensations;
		++counters.unrecoverable;
		log.Fmt(1, "failed to move network interface '{}' back into the home namespace for connection '{}', worker thread torn down: {}"sv,
			interface_name, connection.id,
			GetFullMessage(std::current_exception()));
		return;
	} catch (...) {
		++counters.failed_compensations;
		log.Fmt(1, "failed to move network interface '{}' back into the home namespace for connection '{}': {}"sv,
			interface_name, connection.id,
			GetFullMessage(std::current_exception()));
		return;
	}

	log.Fmt(2, "moved network interface '{}' back into the home namespace for connection '{}'"sv,
		interface_name, connection.id);
}

Connection
InjectElement::Request(Context &ctx, const Connection &connection)
{
	++counters.requests;

	const ChildLogger log{logger, ctx.IsClient() ? "client" : "server"};

	if (ctx.IsCanceled())
		throw AcquisitionError{fmt::format("Request for connection '{}' canceled"sv,
						   connection.id)};

	CheckInterfaceName(connection);
	auto ns = OpenNamespaces(connection);

	Relocate(log, connection, ns, Direction::INTO_PEER);

	Connection result;

	try {
		result = GetNext().Request(ctx, connection);
	} catch (...) {
		Compensate(log, connection, ns);
		RethrowDownstreamError("Request", connection);
	}

	ReleaseNamespace(log, ns.peer, "the peer's");
	ReleaseNamespace(log, ns.home, "the home");
	return result;
}

void
InjectElement::Close(Context &ctx, const Connection &connection)
{
	++counters.closes;

	const ChildLogger log{logger, ctx.IsClient() ? "client" : "server"};

	CheckInterfaceName(connection);

	{
		auto ns = OpenNamespaces(connection);
		Relocate(log, connection, ns, Direction::BACK_HOME);
		ReleaseNamespace(log, ns.peer, "the peer's");
		ReleaseNamespace(log, ns.home, "the home");
	}

	try {
		GetNext().Close(ctx, connection);
	} catch (...) {
		RethrowDownstreamError("Close", connection);
	}
}
