// English: TimerQueue implementation
// 한글: TimerQueue 구현

#include "TimerQueue.h"
#include "Utils/Logger.h"
#include <exception>
#include <utility>

namespace DumpLoader::Concurrency
{

using Utils::Logger;

TimerQueue::TimerQueue(std::string name) : mName(std::move(name)) {}

TimerQueue::~TimerQueue()
{
	Shutdown();
}

bool TimerQueue::Initialize()
{
	std::lock_guard<std::mutex> lock(mMutex);
	if (mRunning.load(std::memory_order_acquire))
	{
		Logger::Warn(mName + ": already running");
		return true;
	}

	mRunning.store(true, std::memory_order_release);
	mWorker = std::thread(&TimerQueue::Run, this);
	Logger::Debug(mName + ": started");
	return true;
}

void TimerQueue::Shutdown()
{
	{
		// English: The flag changes under the lock so the worker cannot check it,
		//          miss the notify, and then sleep for a whole interval
		// 한글: 워커가 플래그를 확인한 뒤 알림을 놓치고 한 간격 전체를 자는 일이 없도록
		//       락 안에서 플래그 변경
		std::lock_guard<std::mutex> lock(mMutex);
		if (!mRunning.load(std::memory_order_acquire))
		{
			return;
		}
		mRunning.store(false, std::memory_order_release);
	}
	mWakeup.notify_all();

	if (mWorker.joinable())
	{
		mWorker.join();
	}

	std::lock_guard<std::mutex> lock(mMutex);
	const size_t dropped = mTimers.size();
	decltype(mTimers) empty;
	mTimers.swap(empty);
	Logger::Debug(mName + ": stopped, " + std::to_string(dropped) + " timer(s) dropped");
}

TimerQueue::TimerHandle TimerQueue::ScheduleRepeat(std::function<bool()> callback, uint32_t intervalMs)
{
	Timer timer;
	timer.mHandle = mNextHandle.fetch_add(1, std::memory_order_relaxed);
	timer.mInterval = std::chrono::milliseconds(intervalMs);
	timer.mDue = Clock::now() + timer.mInterval;
	timer.mCallback = std::move(callback);

	const TimerHandle handle = timer.mHandle;
	{
		std::lock_guard<std::mutex> lock(mMutex);
		mTimers.push(std::move(timer));
	}
	mWakeup.notify_one();
	return handle;
}

bool TimerQueue::WaitForDue(Timer &outTimer)
{
	std::unique_lock<std::mutex> lock(mMutex);
	for (;;)
	{
		if (!mRunning.load(std::memory_order_acquire))
		{
			return false;
		}

		if (mTimers.empty())
		{
			mWakeup.wait(lock);
			continue;
		}

		// English: Wake at the earliest due time; an earlier timer or shutdown wakes us sooner
		// 한글: 가장 이른 기한에 깨어남; 더 이른 타이머나 종료 시 더 일찍 깨어남
		const Clock::time_point due = mTimers.top().mDue;
		if (Clock::now() < due)
		{
			mWakeup.wait_until(lock, due);
			continue;
		}

		outTimer = mTimers.top();
		mTimers.pop();
		return true;
	}
}

void TimerQueue::Fire(Timer timer)
{
	bool again = false;
	try
	{
		again = timer.mCallback();
	}
	catch (const std::exception &e)
	{
		Logger::Error(mName + ": timer " + std::to_string(timer.mHandle) + " threw, retired: " + e.what());
	}

	if (!again || timer.mInterval.count() <= 0)
	{
		return;
	}

	timer.mDue = Clock::now() + timer.mInterval;
	{
		std::lock_guard<std::mutex> lock(mMutex);
		if (!mRunning.load(std::memory_order_acquire))
		{
			return;
		}
		mTimers.push(std::move(timer));
	}
}

void TimerQueue::Run()
{
	Timer timer;
	while (WaitForDue(timer))
	{
		Fire(std::move(timer));
		timer = Timer{};
	}
}

} // namespace DumpLoader::Concurrency
