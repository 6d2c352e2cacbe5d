// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Handle.hxx"
#include "Provider.hxx"

#include <cassert>
#include <utility>

/**
 * An owned #NetnsHandle.  It is released exactly once: either by an
 * explicit Release() call or by the destructor.
 */
class UniqueNetnsHandle {
	NetnsProvider *provider = nullptr;

	NetnsHandle handle;

public:
	UniqueNetnsHandle() = default;

	UniqueNetnsHandle(NetnsProvider &_provider, NetnsHandle _handle) noexcept
		:provider(&_provider), handle(_handle) {}

	UniqueNetnsHandle(UniqueNetnsHandle &&src) noexcept
		:provider(src.provider), handle(NetnsHandle{src.handle.Steal()}) {}

	~UniqueNetnsHandle() noexcept {
		if (IsDefined()) {
			[[maybe_unused]]
			bool released = Release();
		}
	}

	UniqueNetnsHandle &operator=(UniqueNetnsHandle &&src) noexcept {
		using std::swap;
		swap(provider, src.provider);
		swap(handle, src.handle);
		return *this;
	}

	bool IsDefined() const noexcept {
		return handle.IsDefined();
	}

	NetnsHandle Get() const noexcept {
		assert(IsDefined());

		return handle;
	}

	/**
	 * Release the handle now.
	 *
	 * @return false if the provider reported an error (the
	 * handle is released anyway)
	 */
	bool Release() noexcept {
		assert(IsDefined());
		assert(provider != nullptr);

		return provider->Release(NetnsHandle{handle.Steal()});
	}
};
