// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Stats.hxx"
#include "chain/Element.hxx"
#include "io/Logger.hxx"
#include "netns/UniqueHandle.hxx"

#include <atomic>
#include <cstdint>
#include <string_view>

class NetnsProvider;
class NetnsWorker;

/**
 * A chain element which moves the connection's kernel interface from
 * the home network namespace into the peer's namespace on Request()
 * and back on Close().
 *
 * If the successor's Request() fails, the interface is moved back
 * (best effort) and the successor's error is rethrown.
 *
 * All namespace switching happens on the given #NetnsWorker thread;
 * its namespace is the "home" namespace.
 */
class InjectElement final : public ChainElement {
	NetnsProvider &provider;
	NetnsWorker &worker;

	const LLogger logger{"inject"};

	struct Counters {
		std::atomic<uint_least64_t> requests{0}, closes{0};
		std::atomic<uint_least64_t> relocations{0}, failed_relocations{0};
		std::atomic<uint_least64_t> compensations{0}, failed_compensations{0};
		std::atomic<uint_least64_t> unrecoverable{0};
	} counters;

public:
	InjectElement(NetnsProvider &_provider, NetnsWorker &_worker) noexcept
		:provider(_provider), worker(_worker) {}

	[[gnu::pure]]
	InjectStats GetStats() const noexcept;

	/* virtual methods from class Element */
	Connection Request(Context &ctx, const Connection &connection) override;
	void Close(Context &ctx, const Connection &connection) override;

private:
	enum class Direction {
		/**
		 * From the home namespace into the peer's namespace.
		 */
		INTO_PEER,

		/**
		 * From the peer's namespace back into the home
		 * namespace.
		 */
		BACK_HOME,
	};

	/**
	 * The two namespaces involved in one Request() or Close()
	 * call.  "home" is captured once and used by all moves of
	 * that call, even if the worker thread is replaced in
	 * between.
	 */
	struct Namespaces {
		UniqueNetnsHandle peer, home;
	};

	/**
	 * Throws #AcquisitionError on error.
	 */
	UniqueNetnsHandle OpenPeerNamespace(const Connection &connection);

	/**
	 * Obtain the namespace of the worker thread.
	 *
	 * Throws #AcquisitionError on error.
	 */
	UniqueNetnsHandle CaptureHomeNamespace();

	/**
	 * Throws #AcquisitionError on error.
	 */
	Namespaces OpenNamespaces(const Connection &connection);

	/**
	 * Move the interface on the worker thread.
	 *
	 * Throws #InjectError on error.
	 */
	void Relocate(const char *interface_name, const Namespaces &ns,
		      Direction direction);

	/**
	 * Like Relocate(), but updates the counters, adds context to
	 * errors and logs success.
	 */
	template<typename L>
	void Relocate(const L &log, const Connection &connection,
		      const Namespaces &ns, Direction direction);

	/**
	 * Move the interface back after the successor has failed.
	 * Errors are only logged and counted.
	 */
	template<typename L>
	void Compensate(const L &log, const Connection &connection,
			const Namespaces &ns) noexcept;
};
