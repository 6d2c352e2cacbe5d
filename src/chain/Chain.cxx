// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Chain.hxx"
#include "Connection.hxx"

Connection
TailElement::Request(Context &, const Connection &connection)
{
	return connection;
}

void
TailElement::Close(Context &, const Connection &)
{
}

inline Element &
Chain::GetFirst() noexcept
{
	if (elements.empty())
		return tail;

	return *elements.front();
}

Connection
Chain::Request(Context &ctx, const Connection &connection)
{
	return GetFirst().Request(ctx, connection);
}

void
Chain::Close(Context &ctx, const Connection &connection)
{
	GetFirst().Close(ctx, connection);
}

std::unique_ptr<Chain>
ChainBuilder::Build()
{
	/* the constructor is private, so std::make_unique() can't be
	   used */
	std::unique_ptr<Chain> chain{new Chain()};
	chain->elements = std::move(elements);
	elements.clear();

	Element *next = &chain->tail;
	for (auto i = chain->elements.rbegin(); i != chain->elements.rend(); ++i) {
		(*i)->next = next;
		next = i->get();
	}

	return chain;
}
