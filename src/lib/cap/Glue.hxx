// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

/**
 * Does the current process have CAP_SYS_ADMIN?  This is needed to
 * enter another network namespace.
 *
 * Throws std::system_error on error.
 */
bool
IsSysAdmin();

/**
 * Does the current process have CAP_NET_ADMIN?  This is needed to
 * move a network interface to another namespace.
 *
 * Throws std::system_error on error.
 */
bool
HaveNetAdmin();
