// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <utility>

#include <sys/capability.h>

/**
 * OO wrapper for a cap_t.  Requires libcap.
 */
class CapabilityState {
	cap_t value = nullptr;

	explicit CapabilityState(cap_t _value) noexcept:value(_value) {}

public:
	CapabilityState(CapabilityState &&src) noexcept
		:value(std::exchange(src.value, nullptr)) {}

	~CapabilityState() noexcept {
		if (value != nullptr)
			cap_free(value);
	}

	CapabilityState &operator=(CapabilityState &&src) noexcept {
		std::swap(value, src.value);
		return *this;
	}

	/**
	 * Obtain the capability state of the current process.
	 *
	 * Throws std::system_error on error.
	 */
	static CapabilityState Current();

	/**
	 * Throws std::system_error on error.
	 */
	cap_flag_value_t GetFlag(cap_value_t cap, cap_flag_t flag) const;
};
