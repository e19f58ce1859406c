#pragma once

// English: Repeating timers served by one background thread
// 한글: 하나의 백그라운드 스레드가 처리하는 반복 타이머

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace DumpLoader::Concurrency
{

// =============================================================================
// English: TimerQueue - earliest-due-first timers on a single worker thread
// 한글: TimerQueue - 단일 워커 스레드에서 가장 이른 타이머부터 실행
// =============================================================================

/**
 * English: A callback returns true to run again after its interval, false to retire.
 *          Callbacks run on the worker thread outside the lock; keep them short.
 *          Shutdown() wakes the worker even in the middle of a long wait and joins
 *          it, so no callback starts after Shutdown() returns.
 * 한글: 콜백이 true를 반환하면 간격 후 다시 실행, false면 해제.
 *       콜백은 락 밖의 워커 스레드에서 실행되므로 짧게 유지.
 *       Shutdown()은 긴 대기 중이라도 워커를 깨워 join하므로,
 *       Shutdown() 반환 후에는 어떤 콜백도 시작되지 않음.
 */
class TimerQueue
{
  public:
	using Clock = std::chrono::steady_clock;
	using TimerHandle = uint64_t;

	explicit TimerQueue(std::string name = "TimerQueue");
	~TimerQueue();

	TimerQueue(const TimerQueue &) = delete;
	TimerQueue &operator=(const TimerQueue &) = delete;

	bool Initialize();
	void Shutdown();

	// English: First run after intervalMs, then every intervalMs while the callback returns true
	// 한글: intervalMs 후 첫 실행, 이후 콜백이 true를 반환하는 동안 intervalMs마다 실행
	TimerHandle ScheduleRepeat(std::function<bool()> callback, uint32_t intervalMs);

	bool IsRunning() const { return mRunning.load(std::memory_order_acquire); }

  private:
	struct Timer
	{
		TimerHandle mHandle = 0;
		Clock::time_point mDue;
		std::chrono::milliseconds mInterval{0};
		std::function<bool()> mCallback;
	};

	struct DueLater
	{
		bool operator()(const Timer &a, const Timer &b) const { return a.mDue > b.mDue; }
	};

	// English: Blocks until a timer is due (true, timer moved out) or shutdown (false)
	// 한글: 타이머 기한 도래 (true, 타이머 꺼냄) 또는 종료 (false)까지 블록
	bool WaitForDue(Timer &outTimer);

	void Fire(Timer timer);
	void Run();

  private:
	std::string mName;
	std::priority_queue<Timer, std::vector<Timer>, DueLater> mTimers;
	std::mutex mMutex;
	std::condition_variable mWakeup;
	std::thread mWorker;
	std::atomic<bool> mRunning{false};
	std::atomic<TimerHandle> mNextHandle{1};
};

} // namespace DumpLoader::Concurrency
