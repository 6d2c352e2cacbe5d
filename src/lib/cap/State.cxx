// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "State.hxx"
#include "system/Error.hxx"

#include <cassert>

CapabilityState
CapabilityState::Current()
{
	auto value = cap_get_proc();
	if (value == nullptr)
		throw MakeErrno("Failed to read process capabilities");

	return CapabilityState(value);
}

cap_flag_value_t
CapabilityState::GetFlag(cap_value_t cap, cap_flag_t flag) const
{
	assert(value != nullptr);

	cap_flag_value_t flag_value;
	if (cap_get_flag(value, cap, flag, &flag_value) < 0)
		throw MakeErrno("cap_get_flag() failed");

	return flag_value;
}
