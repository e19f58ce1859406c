#pragma once

// English: Thread-safe queue implementation
// 한글: 스레드 안전 큐 구현

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace DumpLoader::Utils
{
// =============================================================================
// English: SafeQueue - thread-safe FIFO with blocking pop and shutdown
// 한글: SafeQueue - 블로킹 pop과 종료를 지원하는 스레드 안전 FIFO
// =============================================================================

template <typename T>
class SafeQueue
{
public:
	SafeQueue() = default;

	SafeQueue(const SafeQueue &) = delete;
	SafeQueue &operator=(const SafeQueue &) = delete;

	// English: Push an item (move) - returns false once the queue has been shut down
	// 한글: 항목 추가 (이동) - 큐가 종료된 후에는 false 반환
	bool Push(T &&item)
	{
		{
			std::lock_guard<std::mutex> lock(mMutex);
			if (mShutdown)
				return false;
			mQueue.push(std::move(item));
		}
		// English: Notify outside lock to avoid waking thread while holding lock
		// 한글: 락을 잡은 채로 스레드를 깨우는 것을 방지하기 위해 락 밖에서 알림
		mCondition.notify_one();
		return true;
	}

	// English: Pop an item from the queue (blocking)
	// 한글: 큐에서 항목 제거 (블로킹)
	// @param item - Reference to store the popped item
	// @param timeoutMs - Timeout in milliseconds (-1 = wait forever)
	// @return true if item was popped, false if timeout or shutdown with an empty queue
	bool Pop(T &item, int timeoutMs = -1)
	{
		std::unique_lock<std::mutex> lock(mMutex);

		if (timeoutMs < 0)
		{
			mCondition.wait(lock, [this] { return !mQueue.empty() || mShutdown; });
		}
		else if (!mCondition.wait_for(lock, std::chrono::milliseconds(timeoutMs),
									  [this] { return !mQueue.empty() || mShutdown; }))
		{
			return false; // Timeout
		}

		if (mQueue.empty())
			return false;

		item = std::move(mQueue.front());
		mQueue.pop();
		return true;
	}

	bool Empty() const
	{
		std::lock_guard<std::mutex> lock(mMutex);
		return mQueue.empty();
	}

	size_t Size() const
	{
		std::lock_guard<std::mutex> lock(mMutex);
		return mQueue.size();
	}

	// English: Shutdown the queue and wake all waiting threads.
	//          Items already queued can still be popped.
	// 한글: 큐를 종료하고 대기 중인 모든 스레드 깨우기.
	//       이미 들어간 항목은 계속 pop 가능.
	void Shutdown()
	{
		{
			std::lock_guard<std::mutex> lock(mMutex);
			mShutdown = true;
		}
		mCondition.notify_all();
	}

private:
	std::queue<T> mQueue;
	mutable std::mutex mMutex;
	std::condition_variable mCondition;
	bool mShutdown = false;
};

} // namespace DumpLoader::Utils
