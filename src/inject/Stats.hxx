// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>

struct InjectStats {
	/**
	 * The total number of Request() and Close() calls (including
	 * failed ones).
	 */
	uint_least64_t requests, closes;

	/**
	 * The number of interface moves attempted by Request() and
	 * Close() and how many of them failed.  Compensation moves
	 * are not counted here.
	 */
	uint_least64_t relocations, failed_relocations;

	/**
	 * The number of attempts to move the interface back after the
	 * successor's Request() has failed, and how many of them
	 * failed.
	 */
	uint_least64_t compensations, failed_compensations;

	/**
	 * How often switching back to the home namespace failed
	 * (which tears down the worker thread)?
	 */
	uint_least64_t unrecoverable;
};
