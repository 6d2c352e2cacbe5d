// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <utility>

/**
 * An unmanaged reference to a network namespace, as handed out by a
 * #NetnsProvider.  Whether two handles refer to the same namespace
 * can only be determined with NetnsProvider::Equals().
 */
class NetnsHandle {
	int value = -1;

public:
	NetnsHandle() = default;

	explicit constexpr NetnsHandle(int _value) noexcept
		:value(_value) {}

	constexpr bool IsDefined() const noexcept {
		return value >= 0;
	}

	constexpr int Get() const noexcept {
		return value;
	}

	int Steal() noexcept {
		return std::exchange(value, -1);
	}
};
