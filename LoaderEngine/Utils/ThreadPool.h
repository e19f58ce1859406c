#pragma once

// English: Thread pool implementation
// 한글: 스레드 풀 구현

#include "Logger.h"
#include "SafeQueue.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace DumpLoader::Utils
{
// =============================================================================
// English: ThreadPool - N persistent workers pulling tasks from a SafeQueue
// 한글: ThreadPool - SafeQueue에서 작업을 꺼내 실행하는 N개의 상주 워커
// =============================================================================

class ThreadPool
{
public:
	// English: Constructor - creates worker threads
	// 한글: 생성자 - 워커 스레드 생성
	// @param numThreads - Number of threads (0 = hardware concurrency)
	explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency())
		: mPendingTasks(0)
	{
		if (numThreads == 0)
			numThreads = 4;

		for (size_t i = 0; i < numThreads; ++i)
		{
			mWorkers.emplace_back(&ThreadPool::WorkerThread, this);
		}
	}

	// English: Destructor - runs every queued task, then joins the workers
	// 한글: 소멸자 - 대기 중인 작업을 모두 실행한 뒤 워커 종료 대기
	~ThreadPool()
	{
		mTasks.Shutdown();

		for (auto &worker : mWorkers)
		{
			if (worker.joinable())
			{
				worker.join();
			}
		}
	}

	ThreadPool(const ThreadPool &) = delete;
	ThreadPool &operator=(const ThreadPool &) = delete;

	// English: Submit a task. Exceptions thrown by the task are stored in the
	//          returned future and rethrown by future::get().
	// 한글: 작업 제출. 작업에서 발생한 예외는 반환된 future에 저장되며
	//       future::get()에서 다시 던져짐.
	template <typename F>
	std::future<std::invoke_result_t<std::decay_t<F>>> Submit(F &&f)
	{
		using Result = std::invoke_result_t<std::decay_t<F>>;

		auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
		std::future<Result> future = task->get_future();

		// English: Count the task before it becomes visible to workers, so
		//          WaitForAll() can never observe an empty queue with the task unaccounted.
		// 한글: 워커가 보기 전에 작업을 집계하여 WaitForAll()이
		//       집계되지 않은 작업과 빈 큐를 관측하지 않도록 함.
		++mPendingTasks;
		if (!mTasks.Push([task]() { (*task)(); }))
		{
			FinishTask();
			Logger::Warn("[ThreadPool] Submit after shutdown - task dropped");
		}

		return future;
	}

	// English: Wait for all submitted tasks to complete
	// 한글: 제출된 모든 작업 완료 대기
	void WaitForAll()
	{
		std::unique_lock<std::mutex> lock(mWaitMutex);
		mWaitCV.wait(lock, [this] { return mPendingTasks.load() == 0; });
	}

	// English: Get number of worker threads
	// 한글: 워커 스레드 수 가져오기
	size_t GetThreadCount() const { return mWorkers.size(); }

	// English: Get number of submitted but unfinished tasks
	// 한글: 제출되었지만 끝나지 않은 작업 수 가져오기
	size_t GetPendingTaskCount() const { return mPendingTasks.load(); }

private:
	std::vector<std::thread> mWorkers;
	SafeQueue<std::function<void()>> mTasks;
	std::atomic<size_t> mPendingTasks;
	std::mutex mWaitMutex;
	std::condition_variable mWaitCV;

	void FinishTask()
	{
		if (--mPendingTasks == 0)
		{
			std::lock_guard<std::mutex> lock(mWaitMutex);
			mWaitCV.notify_all();
		}
	}

	// English: Worker thread function - exits once the queue is shut down and drained
	// 한글: 워커 스레드 함수 - 큐가 종료되고 비워지면 종료
	void WorkerThread()
	{
		std::function<void()> task;
		while (mTasks.Pop(task))
		{
			// English: packaged_task captures any exception into its future
			// 한글: packaged_task가 예외를 future에 저장
			task();
			task = nullptr;
			FinishTask();
		}
	}
};

} // namespace DumpLoader::Utils
