// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Worker.hxx"
#include "Error.hxx"

#include <cassert>
#include <future>
#include <utility>

struct NetnsWorker::Job {
	std::function<void()> function;

	std::promise<void> promise;

	explicit Job(std::function<void()> &&_function) noexcept
		:function(std::move(_function)) {}
};

NetnsWorker::~NetnsWorker() noexcept
{
	{
		const std::scoped_lock lock{mutex};
		quit = true;
	}

	cond.notify_one();

	if (thread.joinable())
		thread.join();
}

inline void
NetnsWorker::StartThread()
{
	if (thread.joinable()) {
		std::unique_lock lock{mutex};
		if (!defunct)
			return;

		/* the previous thread has exited after an
		   unrecoverable error; reap it and start over */
		lock.unlock();
		thread.join();
		lock.lock();
		defunct = false;
	}

	thread = std::thread(&NetnsWorker::ThreadFunc, this);
}

void
NetnsWorker::Run(std::function<void()> function)
{
	const std::scoped_lock run_lock{run_mutex};

	StartThread();

	Job job{std::move(function)};
	auto future = job.promise.get_future();

	{
		const std::scoped_lock lock{mutex};
		assert(pending == nullptr);
		pending = &job;
	}

	cond.notify_one();

	future.get();
}

void
NetnsWorker::ThreadFunc() noexcept
{
	std::unique_lock lock{mutex};

	while (true) {
		cond.wait(lock, [this]{ return quit || pending != nullptr; });
		if (pending == nullptr)
			break;

		/* take over the promise, so the caller may destroy
		   its Job as soon as the future becomes ready */
		Job job = std::move(*std::exchange(pending, nullptr));
		lock.unlock();

		try {
			job.function();
			job.promise.set_value();
		} catch (const UnrecoverableStateError &) {
			/* this thread's namespace is unknown; mark it
			   defunct before waking up the caller, so the
			   next Run() call starts a fresh thread */
			lock.lock();
			defunct = true;
			++teardowns;
			lock.unlock();

			job.promise.set_exception(std::current_exception());
			return;
		} catch (...) {
			job.promise.set_exception(std::current_exception());
		}

		lock.lock();
	}
}
