// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

class NetnsSwitcher;
class NetnsHandle;

/**
 * Move a network interface from one network namespace to another.
 * The calling thread temporarily enters the source namespace to look
 * up the interface; afterwards, it always switches back to the
 * switcher's home namespace, even if the operation failed.
 *
 * Must be called on the thread which owns the #NetnsSwitcher.
 *
 * Throws #SwitchError if entering the source namespace failed,
 * #LookupError if the interface was not found there,
 * #RelocationError if the kernel refused to move it and
 * #UnrecoverableStateError if switching back home failed (this
 * supersedes any other error).
 *
 * @param interface_name the name of the interface in the source
 * namespace
 * @param from the namespace which contains the interface
 * @param to the destination namespace
 */
void
MoveInterface(NetnsSwitcher &switcher, const char *interface_name,
	      NetnsHandle from, NetnsHandle to);
