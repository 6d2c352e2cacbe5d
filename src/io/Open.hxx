// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

class UniqueFileDescriptor;

/**
 * Open a file for reading.
 *
 * Throws std::system_error on error.
 *
 * @param flags additional flags for open(), e.g. O_NOFOLLOW
 */
UniqueFileDescriptor
OpenReadOnly(const char *path, int flags=0);
