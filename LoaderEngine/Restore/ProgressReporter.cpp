// English: ProgressReporter implementation
// 한글: ProgressReporter 구현

#include "ProgressReporter.h"
#include "Utils/Logger.h"
#include <iomanip>
#include <sstream>

namespace DumpLoader
{
namespace Restore
{

ProgressReporter::ProgressReporter(const RestoreProgress &progress, uint32_t intervalMs)
	: mProgress(progress), mIntervalMs(intervalMs), mStartTime(std::chrono::steady_clock::now()),
	  mTimer("ProgressReporter"), mTicks(0)
{
}

ProgressReporter::~ProgressReporter()
{
	Stop();
}

void ProgressReporter::Start(std::chrono::steady_clock::time_point startTime)
{
	if (mTimer.IsRunning())
	{
		return;
	}

	mStartTime = startTime;
	mTimer.Initialize();
	mTimer.ScheduleRepeat([this]() { return Tick(); }, mIntervalMs);
}

void ProgressReporter::Stop()
{
	mTimer.Shutdown();
}

bool ProgressReporter::Tick()
{
	const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - mStartTime;
	Utils::Logger::Info(FormatProgress(mProgress.GetBytes(), elapsed.count()));
	++mTicks;
	return true;
}

std::string ProgressReporter::FormatProgress(uint64_t bytes, double elapsedSeconds)
{
	const double megabytes = RestoreProgress::ToMegabytes(bytes);
	const double rate = elapsedSeconds > 0.0 ? megabytes / elapsedSeconds : 0.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << "restoring.allbytes[" << megabytes << "MB].time["
		<< elapsedSeconds << "sec].rates[" << rate << "MB/sec]...";
	return oss.str();
}

} // namespace Restore
} // namespace DumpLoader
