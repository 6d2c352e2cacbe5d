// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cassert>

struct Context;
struct Connection;

/**
 * A request-processing element.  Errors are reported by throwing
 * exceptions.
 */
class Element {
public:
	virtual ~Element() noexcept = default;

	/**
	 * Set up the connection.
	 *
	 * Throws on error.
	 *
	 * @return the (possibly modified) connection as established
	 * by this element and its successors
	 */
	[[nodiscard]]
	virtual Connection Request(Context &ctx, const Connection &connection) = 0;

	/**
	 * Tear down the connection.
	 *
	 * Throws on error.
	 */
	virtual void Close(Context &ctx, const Connection &connection) = 0;
};

/**
 * An #Element which delegates to a successor.  The successor is
 * assigned by #ChainBuilder.
 */
class ChainElement : public Element {
	friend class ChainBuilder;

	Element *next = nullptr;

protected:
	Element &GetNext() const noexcept {
		assert(next != nullptr);
		return *next;
	}
};
