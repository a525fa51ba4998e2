/*
Cutout Studio
Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include <CutoutStudio/TaskQueue/ThrottledTaskQueue.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "NullLogger.hpp"

using CutoutStudio::TaskQueue::ThrottledTaskQueue;
using namespace std::chrono_literals;

namespace {

// Occupies the worker until release() is called.
class Blocker {
public:
	ThrottledTaskQueue::CancellableTask task()
	{
		return [this](const ThrottledTaskQueue::CancellationToken &) {
			started_.set_value();
			released_.wait();
		};
	}

	void waitStarted() { started_.get_future().wait(); }
	void release() { release_.set_value(); }

private:
	std::promise<void> started_;
	std::promise<void> release_;
	std::shared_future<void> released_ = release_.get_future().share();
};

} // namespace

TEST(ThrottledTaskQueueTest, RejectsZeroCapacity)
{
	EXPECT_THROW(ThrottledTaskQueue(std::make_shared<NullLogger>(), 0), std::invalid_argument);
}

TEST(ThrottledTaskQueueTest, RunsTasksInOrder)
{
	std::mutex mutex;
	std::vector<int> order;
	std::promise<void> done;

	ThrottledTaskQueue queue(std::make_shared<NullLogger>(), 8);

	for (int i = 0; i < 3; ++i) {
		queue.push([&, i](const ThrottledTaskQueue::CancellationToken &) {
			std::lock_guard<std::mutex> lock(mutex);
			order.push_back(i);
		});
	}
	queue.push([&](const ThrottledTaskQueue::CancellationToken &) { done.set_value(); });

	ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
	std::lock_guard<std::mutex> lock(mutex);
	EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(ThrottledTaskQueueTest, FullQueueDropsOldest)
{
	Blocker blocker;
	std::atomic<bool> oldestRan = false;
	std::promise<void> newestRan;

	ThrottledTaskQueue queue(std::make_shared<NullLogger>(), 1);
	queue.push(blocker.task());
	blocker.waitStarted();

	const auto oldestToken =
		queue.push([&](const ThrottledTaskQueue::CancellationToken &) { oldestRan = true; });
	const auto newestToken =
		queue.push([&](const ThrottledTaskQueue::CancellationToken &) { newestRan.set_value(); });

	EXPECT_TRUE(oldestToken->load());
	EXPECT_FALSE(newestToken->load());

	blocker.release();
	ASSERT_EQ(newestRan.get_future().wait_for(5s), std::future_status::ready);
	EXPECT_FALSE(oldestRan);
}

TEST(ThrottledTaskQueueTest, CancelAllReachesRunningTaskAndQueueStaysUsable)
{
	std::promise<void> started;
	std::promise<bool> sawCancel;
	std::promise<void> after;

	ThrottledTaskQueue queue(std::make_shared<NullLogger>(), 1);
	queue.push([&](const ThrottledTaskQueue::CancellationToken &token) {
		started.set_value();
		const auto deadline = std::chrono::steady_clock::now() + 5s;
		while (!token->load() && std::chrono::steady_clock::now() < deadline) {
			std::this_thread::sleep_for(1ms);
		}
		sawCancel.set_value(token->load());
	});
	started.get_future().wait();

	queue.cancelAll();
	EXPECT_TRUE(sawCancel.get_future().get());

	queue.push([&](const ThrottledTaskQueue::CancellationToken &) { after.set_value(); });
	EXPECT_EQ(after.get_future().wait_for(5s), std::future_status::ready);
}

TEST(ThrottledTaskQueueTest, ThrowingTaskDoesNotStopWorker)
{
	std::promise<void> next;

	ThrottledTaskQueue queue(std::make_shared<NullLogger>(), 4);
	queue.push([](const ThrottledTaskQueue::CancellationToken &) { throw std::runtime_error("boom"); });
	queue.push([&](const ThrottledTaskQueue::CancellationToken &) { next.set_value(); });
	EXPECT_EQ(next.get_future().wait_for(5s), std::future_status::ready);
}

TEST(ThrottledTaskQueueTest, PushAfterShutdownThrows)
{
	ThrottledTaskQueue queue(std::make_shared<NullLogger>(), 1);
	queue.shutdown();
	EXPECT_THROW(queue.push([](const ThrottledTaskQueue::CancellationToken &) {}), std::runtime_error);
}
