// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <stdexcept>
#include <string>

/**
 * An error reported by libnl.
 */
class NetlinkError : public std::runtime_error {
	int code;

public:
	/**
	 * @param _code the (negative) return value of the libnl
	 * function
	 */
	NetlinkError(int _code, const std::string &msg);

	/**
	 * @return the libnl error code (NLE_*, positive)
	 */
	int GetCode() const noexcept {
		return code;
	}
};
