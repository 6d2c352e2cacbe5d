// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"

#include <netlink/errno.h>

#include <stdlib.h>

NetlinkError::NetlinkError(int _code, const std::string &msg)
	:std::runtime_error(msg + ": " + nl_geterror(_code)),
	 code(abs(_code)) {}
