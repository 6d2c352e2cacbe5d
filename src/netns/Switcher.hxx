// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "UniqueHandle.hxx"

#include <thread>

/**
 * Remembers the network namespace of the calling thread ("home") and
 * switches the thread between namespaces.
 *
 * Namespace membership is a property of the OS thread, therefore an
 * instance must be used only on the thread which constructed it (see
 * #NetnsWorker).
 */
class NetnsSwitcher {
	NetnsProvider &provider;

	/**
	 * Owns #home if it was captured by this object.
	 */
	UniqueNetnsHandle owned_home;

	NetnsHandle home;

#ifndef NDEBUG
	const std::thread::id thread = std::this_thread::get_id();
#endif

public:
	/**
	 * Capture the calling thread's current namespace as "home".
	 *
	 * Throws #AcquisitionError on error.
	 */
	explicit NetnsSwitcher(NetnsProvider &_provider);

	/**
	 * Use an existing handle (obtained earlier with
	 * NetnsProvider::GetCurrent()) as "home".  The caller keeps
	 * ownership; it must outlive this object.
	 */
	NetnsSwitcher(NetnsProvider &_provider, NetnsHandle _home) noexcept
		:provider(_provider), home(_home) {}

	NetnsSwitcher(const NetnsSwitcher &) = delete;
	NetnsSwitcher &operator=(const NetnsSwitcher &) = delete;

	NetnsProvider &GetProvider() const noexcept {
		return provider;
	}

	bool IsClosed() const noexcept {
		return !home.IsDefined();
	}

	NetnsHandle GetHome() const noexcept {
		assert(!IsClosed());

		return home;
	}

	/**
	 * Move the calling thread into the given namespace.  This is
	 * a no-op if the thread is already there.
	 *
	 * Throws #SwitchError on error.
	 */
	void SwitchTo(NetnsHandle target);

	void SwitchHome() {
		SwitchTo(GetHome());
	}

	/**
	 * Release the "home" handle (unless it is borrowed).  No
	 * other method may be called afterwards.  The destructor
	 * releases an owned handle implicitly.
	 *
	 * @return false if releasing the handle failed
	 */
	bool Close() noexcept;
};
