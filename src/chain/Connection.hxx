// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <functional>
#include <map>
#include <string>

/**
 * Parameters of the "kernel interface" mechanism: which interface is
 * plugged into the connection and which network namespace it
 * belongs to.
 */
struct KernelMechanism {
	/**
	 * A reference to the peer's network namespace: an absolute
	 * path, a "file://" URL or a name below the configured
	 * namespace directory.
	 */
	std::string netns_url;

	/**
	 * The name of the kernel network interface.
	 */
	std::string interface_name;
};

/**
 * A logical network connection passing through the element chain.
 */
struct Connection {
	std::string id;

	KernelMechanism mechanism;

	/**
	 * Free-form labels; elements which don't know a label pass
	 * it on unchanged.
	 */
	std::map<std::string, std::string, std::less<>> labels;
};
