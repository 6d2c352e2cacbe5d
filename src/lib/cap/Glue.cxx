// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Glue.hxx"
#include "State.hxx"

bool
IsSysAdmin()
{
	const auto s = CapabilityState::Current();
	return s.GetFlag(CAP_SYS_ADMIN, CAP_EFFECTIVE) == CAP_SET;
}

bool
HaveNetAdmin()
{
	const auto s = CapabilityState::Current();
	return s.GetFlag(CAP_NET_ADMIN, CAP_EFFECTIVE) == CAP_SET;
}
