// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <functional>
#include <map>
#include <stop_token>
#include <string>

/**
 * Request-scoped values passed along the element chain.  It does
 * not know the chain itself.
 */
struct Context {
	enum class Role {
		/**
		 * The element runs on the server (forwarder) side of
		 * the connection.
		 */
		SERVER,

		CLIENT,
	};

	/**
	 * Cancellation requested by the caller.  Elements may check
	 * it before starting an operation, but never abort an
	 * operation which is already running.
	 */
	std::stop_token stop_token;

	Role role = Role::SERVER;

	std::map<std::string, std::string, std::less<>> metadata;

	bool IsCanceled() const noexcept {
		return stop_token.stop_requested();
	}

	bool IsClient() const noexcept {
		return role == Role::CLIENT;
	}
};
