// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>
#include <string_view>

/**
 * Convert a network namespace reference into a file system path.
 * Accepted are absolute paths, "file://" URLs with an absolute path
 * and plain namespace names (as created by "ip netns add"), which
 * are looked up in the given directory.
 *
 * Throws std::invalid_argument if the reference is malformed.
 */
std::string
ResolveNetnsReference(std::string_view reference,
		      std::string_view netns_directory);
