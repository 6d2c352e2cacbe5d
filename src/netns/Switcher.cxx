// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Switcher.hxx"
#include "Error.hxx"

static UniqueNetnsHandle
GetCurrentNetns(NetnsProvider &provider)
try {
	return provider.GetCurrent();
} catch (...) {
	std::throw_with_nested(AcquisitionError{"Failed to obtain the current network namespace"});
}

NetnsSwitcher::NetnsSwitcher(NetnsProvider &_provider)
	:provider(_provider), owned_home(GetCurrentNetns(provider)),
	 home(owned_home.Get())
{
}

void
NetnsSwitcher::SwitchTo(NetnsHandle target)
{
	assert(!IsClosed());
	assert(thread == std::this_thread::get_id());

	UniqueNetnsHandle current;

	try {
		current = provider.GetCurrent();
	} catch (...) {
		std::throw_with_nested(SwitchError{"Failed to obtain the current network namespace"});
	}

	if (provider.Equals(current.Get(), target))
		return;

	try {
		provider.SetCurrent(target);
	} catch (...) {
		std::throw_with_nested(SwitchError{"Failed to switch network namespace"});
	}
}

bool
NetnsSwitcher::Close() noexcept
{
	assert(!IsClosed());

	home = {};
	return !owned_home.IsDefined() || owned_home.Release();
}
