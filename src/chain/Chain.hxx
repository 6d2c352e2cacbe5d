// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Element.hxx"

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

/**
 * The last element of every chain.  Request() returns the connection
 * unchanged and Close() does nothing.
 */
class TailElement final : public Element {
public:
	/* virtual methods from class Element */
	Connection Request(Context &ctx, const Connection &connection) override;
	void Close(Context &ctx, const Connection &connection) override;
};

/**
 * An ordered sequence of elements, each linked to its successor.
 * Created by #ChainBuilder.
 */
class Chain final : public Element {
	friend class ChainBuilder;

	std::vector<std::unique_ptr<ChainElement>> elements;

	TailElement tail;

	Chain() = default;

public:
	Chain(Chain &&) = delete;
	Chain &operator=(Chain &&) = delete;

	std::size_t size() const noexcept {
		return elements.size();
	}

	/* virtual methods from class Element */
	Connection Request(Context &ctx, const Connection &connection) override;
	void Close(Context &ctx, const Connection &connection) override;

private:
	Element &GetFirst() noexcept;
};

class ChainBuilder {
	std::vector<std::unique_ptr<ChainElement>> elements;

public:
	/**
	 * Append an element.  Returns a reference to it, which
	 * remains valid for the lifetime of the #Chain.
	 */
	template<typename T>
	T &Add(std::unique_ptr<T> &&element) noexcept {
		T &result = *element;
		elements.emplace_back(std::move(element));
		return result;
	}

	template<typename T, typename... Args>
	T &Emplace(Args&&... args) {
		return Add(std::make_unique<T>(std::forward<Args>(args)...));
	}

	/**
	 * Link all elements and move them into a new #Chain.  This
	 * builder is empty afterwards.
	 */
	std::unique_ptr<Chain> Build();
};
