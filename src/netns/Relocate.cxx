// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Relocate.hxx"
#include "Switcher.hxx"
#include "Error.hxx"
#include "util/Exception.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

/**
 * Throws #UnrecoverableStateError on error.
 *
 * @param error the error which caused the operation to fail, to be
 * mentioned in the message; may be nullptr
 */
static void
RestoreHome(NetnsSwitcher &switcher, std::exception_ptr error=nullptr)
{
	try {
		switcher.SwitchHome();
	} catch (...) {
		if (error)
			std::throw_with_nested(UnrecoverableStateError{
					fmt::format("Failed to switch back to the home network namespace after error: {}"sv,
						    GetFullMessage(error))});

		std::throw_with_nested(UnrecoverableStateError{"Failed to switch back to the home network namespace"});
	}
}

static InterfaceRef
LookupInterface(NetnsProvider &provider, const char *name)
try {
	return provider.FindInterface(name);
} catch (...) {
	std::throw_with_nested(LookupError{fmt::format("Failed to find network interface '{}'"sv,
						       name)});
}

static void
ReassignInterface(NetnsProvider &provider, const InterfaceRef &interface,
	      NetnsHandle to)
try {
	provider.MoveInterface(interface, to);
} catch (...) {
	std::throw_with_nested(RelocationError{fmt::format("Failed to move network interface '{}' to namespace handle {}"sv,
							   interface.name, to.Get())});
}

void
MoveInterface(NetnsSwitcher &switcher, const char *interface_name,
	      NetnsHandle from, NetnsHandle to)
{
	auto &provider = switcher.GetProvider();

	switcher.SwitchTo(from);

	try {
		const auto interface = LookupInterface(provider, interface_name);
		ReassignInterface(provider, interface, to);
	} catch (...) {
		RestoreHome(switcher, std::current_exception());
		throw;
	}

	RestoreHome(switcher);
}
