/*
 * CutoutStudio TaskQueue Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

#include <CutoutStudio/Logger/ILogger.hpp>

namespace CutoutStudio::TaskQueue {

/**
 * @brief A single-worker queue for cancellable tasks with a bounded backlog.
 *
 * The worker thread starts on construction and is joined on destruction.
 * When the backlog is full, the oldest queued task is cancelled and dropped,
 * so with a limit of 1 only the most recent request survives.
 *
 * Cancellation is cooperative: a task receives its token and is expected to
 * check it before publishing any result.
 */
class ThrottledTaskQueue {
public:
	using CancellationToken = std::shared_ptr<std::atomic<bool>>;
	using CancellableTask = std::function<void(const CancellationToken &)>;

private:
	struct QueuedTask {
		std::function<void()> run;
		CancellationToken token;
	};

public:
	ThrottledTaskQueue(std::shared_ptr<const Logger::ILogger> logger, std::size_t maxQueueSize)
		: logger_(std::move(logger)),
		  maxQueueSize_(maxQueueSize > 0 ? maxQueueSize
						 : throw std::invalid_argument("maxQueueSize must be greater than 0")),
		  worker_(&ThrottledTaskQueue::workerLoop, this)
	{
	}

	~ThrottledTaskQueue() noexcept { shutdown(); }

	ThrottledTaskQueue(const ThrottledTaskQueue &) = delete;
	ThrottledTaskQueue &operator=(const ThrottledTaskQueue &) = delete;
	ThrottledTaskQueue(ThrottledTaskQueue &&) = delete;
	ThrottledTaskQueue &operator=(ThrottledTaskQueue &&) = delete;

	/**
	 * @brief Stops accepting tasks, cancels everything and joins the worker.
	 */
	void shutdown() noexcept
	{
		if (worker_.joinable()) {
			stop();
			worker_.join();
		}
	}

	/**
	 * @brief Enqueues a task.
	 * @return The token that cancels this task when set to true.
	 * @throws std::runtime_error if the queue has been shut down.
	 */
	CancellationToken push(CancellableTask userTask)
	{
		auto token = std::make_shared<std::atomic<bool>>(false);

		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (stopped_) {
				throw std::runtime_error("push on stopped ThrottledTaskQueue");
			}

			while (queue_.size() >= maxQueueSize_) {
				queue_.front().token->store(true);
				queue_.pop_front();
				logger_->debug("TaskDropped", {});
			}
			queue_.push_back({[task = std::move(userTask), token] { task(token); }, token});
		}
		cond_.notify_one();
		return token;
	}

	/**
	 * @brief Cancels every queued task and the one currently running.
	 *
	 * The queue stays usable afterwards.
	 */
	void cancelAll() noexcept
	{
		std::lock_guard<std::mutex> lock(mutex_);
		for (QueuedTask &queued : queue_) {
			queued.token->store(true);
		}
		queue_.clear();
		if (currentTaskToken_) {
			currentTaskToken_->store(true);
		}
	}

private:
	void workerLoop()
	{
		while (std::optional<QueuedTask> queued = pop()) {
			if (queued->token->load()) {
				clearCurrent();
				continue;
			}

			try {
				queued->run();
			} catch (const std::exception &e) {
				logger_->error("TaskExceptionError", {{"message", e.what()}});
			} catch (...) {
				logger_->error("TaskUnknownExceptionError", {});
			}

			clearCurrent();
		}
	}

	std::optional<QueuedTask> pop()
	{
		std::unique_lock<std::mutex> lock(mutex_);
		cond_.wait(lock, [this] { return !queue_.empty() || stopped_; });

		if (stopped_ && queue_.empty()) {
			return std::nullopt;
		}

		QueuedTask queued = std::move(queue_.front());
		queue_.pop_front();
		currentTaskToken_ = queued.token;
		return queued;
	}

	void clearCurrent()
	{
		std::lock_guard<std::mutex> lock(mutex_);
		currentTaskToken_.reset();
	}

	void stop() noexcept
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (stopped_) {
				return;
			}
			stopped_ = true;

			for (QueuedTask &queued : queue_) {
				queued.token->store(true);
			}
			queue_.clear();

			if (currentTaskToken_) {
				currentTaskToken_->store(true);
			}
		}
		cond_.notify_all();
	}

	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::size_t maxQueueSize_;
	std::mutex mutex_;
	std::condition_variable cond_;
	std::deque<QueuedTask> queue_;
	bool stopped_ = false;
	CancellationToken currentTaskToken_;
	std::thread worker_;
};

} // namespace CutoutStudio::TaskQueue
