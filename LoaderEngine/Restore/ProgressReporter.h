#pragma once

// English: Periodic throughput logging while the data phase runs
// 한글: 데이터 단계 실행 중 주기적인 처리량 로깅

#include "Concurrency/TimerQueue.h"
#include "RestoreProgress.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace DumpLoader
{
namespace Restore
{

// =============================================================================
// English: ProgressReporter class
// 한글: ProgressReporter 클래스
// =============================================================================

/**
 * English: Samples a RestoreProgress on a TimerQueue. Stop() wakes and joins the
 *          timer thread at once, however long the interval is, and no tick fires
 *          after it returns. The reporter only reads the counter.
 * 한글: TimerQueue에서 RestoreProgress를 샘플링. Stop()은 간격에 상관없이 타이머
 *       스레드를 즉시 깨우고 join하며, 반환 후에는 어떤 틱도 발생하지 않음.
 *       리포터는 카운터를 읽기만 함.
 */
class ProgressReporter
{
  public:
	ProgressReporter(const RestoreProgress &progress, uint32_t intervalMs);
	~ProgressReporter();

	ProgressReporter(const ProgressReporter &) = delete;
	ProgressReporter &operator=(const ProgressReporter &) = delete;

	void Start(std::chrono::steady_clock::time_point startTime);
	void Stop();

	bool IsRunning() const { return mTimer.IsRunning(); }

	uint64_t GetTickCount() const { return mTicks.load(); }

	// English: "restoring.allbytes[..MB].time[..sec].rates[..MB/sec]..."
	// 한글: "restoring.allbytes[..MB].time[..sec].rates[..MB/sec]..."
	static std::string FormatProgress(uint64_t bytes, double elapsedSeconds);

  private:
	bool Tick();

  private:
	const RestoreProgress &mProgress;
	uint32_t mIntervalMs;
	std::chrono::steady_clock::time_point mStartTime;
	Concurrency::TimerQueue mTimer;
	std::atomic<uint64_t> mTicks;
};

} // namespace Restore
} // namespace DumpLoader
