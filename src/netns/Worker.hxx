// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

/**
 * A dedicated OS thread which executes network namespace operations.
 *
 * Each job passed to Run() is one complete
 * switch/operate/switch-back sequence; it runs on this thread from
 * start to end and no other job runs on the thread meanwhile.  The
 * caller blocks until the job is finished.
 *
 * If a job throws #UnrecoverableStateError, the thread is in an
 * unknown namespace; it is terminated and the next Run() call starts
 * a new one.
 */
class NetnsWorker {
	struct Job;

	/**
	 * Serializes Run() callers.
	 */
	std::mutex run_mutex;

	/**
	 * Protects #pending, #defunct, #quit.
	 */
	mutable std::mutex mutex;
	std::condition_variable cond;

	std::thread thread;

	Job *pending = nullptr;

	/**
	 * Has the thread exited after an #UnrecoverableStateError?
	 */
	bool defunct = false;

	bool quit = false;

	/**
	 * The number of threads which were torn down.
	 */
	unsigned teardowns = 0;

public:
	NetnsWorker() noexcept = default;
	~NetnsWorker() noexcept;

	NetnsWorker(const NetnsWorker &) = delete;
	NetnsWorker &operator=(const NetnsWorker &) = delete;

	/**
	 * Execute the function on the worker thread and wait for it
	 * to finish.  Exceptions thrown by the function are rethrown
	 * here.
	 *
	 * The thread is started lazily; it inherits the namespace of
	 * the thread which calls Run() first.
	 */
	void Run(std::function<void()> function);

	unsigned GetTeardowns() const noexcept {
		const std::scoped_lock lock{mutex};
		return teardowns;
	}

private:
	void StartThread();
	void ThreadFunc() noexcept;
};
