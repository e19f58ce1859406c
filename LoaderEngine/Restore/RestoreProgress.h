#pragma once

// English: Shared byte counter of one restore run
// 한글: 복원 실행 하나의 공유 바이트 카운터

#include <atomic>
#include <cstdint>

namespace DumpLoader
{
namespace Restore
{

// English: Only ever increases; a new run uses a new instance
// 한글: 증가만 함; 새 실행은 새 인스턴스를 사용
class RestoreProgress
{
  public:
	RestoreProgress() : mBytes(0), mCompletedTables(0) {}

	RestoreProgress(const RestoreProgress &) = delete;
	RestoreProgress &operator=(const RestoreProgress &) = delete;

	void AddTable(uint64_t bytes)
	{
		mBytes.fetch_add(bytes, std::memory_order_relaxed);
		mCompletedTables.fetch_add(1, std::memory_order_relaxed);
	}

	uint64_t GetBytes() const { return mBytes.load(std::memory_order_relaxed); }

	uint64_t GetCompletedTables() const { return mCompletedTables.load(std::memory_order_relaxed); }

	static double ToMegabytes(uint64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); }

  private:
	std::atomic<uint64_t> mBytes;
	std::atomic<uint64_t> mCompletedTables;
};

} // namespace Restore
} // namespace DumpLoader
