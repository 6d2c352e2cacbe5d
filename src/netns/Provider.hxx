// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Handle.hxx"

#include <string>

class UniqueNetnsHandle;

/**
 * A kernel network interface looked up in the namespace which was
 * current on the calling thread at the time of the lookup.
 */
struct InterfaceRef {
	unsigned index;

	std::string name;
};

/**
 * Access to the operating system's network namespaces.  Except for
 * Open(), Equals() and Release(), all methods operate on (or in) the
 * namespace of the calling thread.
 */
class NetnsProvider {
public:
	virtual ~NetnsProvider() noexcept = default;

	/**
	 * Obtain a handle to the calling thread's current network
	 * namespace.
	 *
	 * Throws on error.
	 */
	virtual UniqueNetnsHandle GetCurrent() = 0;

	/**
	 * Open a network namespace by reference (a path or a URL).
	 *
	 * Throws on error.
	 */
	virtual UniqueNetnsHandle Open(const char *reference) = 0;

	/**
	 * Do both handles refer to the same namespace?
	 */
	virtual bool Equals(NetnsHandle a, NetnsHandle b) const noexcept = 0;

	/**
	 * Move the calling thread into the given namespace.
	 *
	 * Throws on error.
	 */
	virtual void SetCurrent(NetnsHandle handle) = 0;

	/**
	 * Look up a network interface by name in the calling
	 * thread's current namespace.
	 *
	 * Throws on error (including "not found").
	 */
	virtual InterfaceRef FindInterface(const char *name) = 0;

	/**
	 * Move a network interface (which must have been looked up in
	 * the calling thread's current namespace) into another
	 * namespace.
	 *
	 * Throws on error.
	 */
	virtual void MoveInterface(const InterfaceRef &interface,
				   NetnsHandle destination) = 0;

	/**
	 * Release a handle obtained by GetCurrent() or Open().  The
	 * handle is invalid afterwards, even if this method fails.
	 *
	 * @return false on error
	 */
	virtual bool Release(NetnsHandle handle) noexcept = 0;
};
