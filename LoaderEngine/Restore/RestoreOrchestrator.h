#pragma once

// English: Top-level restore driver (databases -> table schemas -> table data)
// 한글: 최상위 복원 드라이버 (데이터베이스 -> 테이블 스키마 -> 테이블 데이터)

#include "DumpCatalog.h"
#include "Interfaces/IConnectionPool.h"
#include "RestoreProgress.h"
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace DumpLoader
{
namespace Restore
{

// =============================================================================
// English: Options / result
// 한글: 옵션 / 결과
// =============================================================================

struct RestoreOptions
{
	std::string mDumpDir;
	uint32_t mProgressIntervalMs = 10000;

	// English: 0 = seed the shuffle from std::random_device
	// 한글: 0 = std::random_device로 셔플 시드 설정
	uint32_t mShuffleSeed = 0;
};

struct RestoreSummary
{
	double mElapsedSeconds = 0.0; // data phase only
	uint64_t mTotalBytes = 0;
	size_t mDatabaseCount = 0;
	size_t mSchemaCount = 0;
	size_t mTableCount = 0;
};

// English: Uniform in-place shuffle: for i from 1 upward, swap i with a uniform j in [0, i]
// 한글: 균등 제자리 셔플: i를 1부터 증가시키며 [0, i] 범위의 균등한 j와 교환
void ShuffleTables(std::vector<std::string> &tables, std::mt19937 &engine);

// =============================================================================
// English: RestoreOrchestrator class
// 한글: RestoreOrchestrator 클래스
// =============================================================================

/**
 * English: Runs one restore against a connection pool.
 *          0. validate every table file name
 *          1. database files on one connection
 *          2. table schema files on one connection
 *          3. shuffle the table files
 *          4. one ThreadPool task per table file, each holding one pooled connection;
 *             the driver acquires the connection before submitting, so concurrency
 *             never exceeds the pool size
 *          5. progress reporting during 4, final summary after
 *          The first failure in any phase is rethrown from Run(). In the data phase
 *          it stops dispatch; tasks already running finish first.
 * 한글: 연결 풀을 대상으로 한 번의 복원 실행.
 *       0. 모든 테이블 파일 이름 검증
 *       1. 하나의 연결에서 데이터베이스 파일 실행
 *       2. 하나의 연결에서 테이블 스키마 파일 실행
 *       3. 테이블 파일 셔플
 *       4. 테이블 파일마다 ThreadPool 작업 하나, 각 작업은 풀 연결 하나를 보유;
 *          드라이버가 제출 전에 연결을 획득하므로 동시성은 풀 크기를 넘지 않음
 *       5. 4 동안 진행 상황 보고, 이후 최종 요약
 *       모든 단계의 첫 실패는 Run()에서 다시 던짐. 데이터 단계에서는 디스패치를
 *       중단하고, 이미 실행 중인 작업은 끝날 때까지 기다림.
 */
class RestoreOrchestrator
{
  public:
	RestoreOrchestrator(Database::IConnectionPool &pool, RestoreOptions options);

	RestoreOrchestrator(const RestoreOrchestrator &) = delete;
	RestoreOrchestrator &operator=(const RestoreOrchestrator &) = delete;

	// English: Catalog options.mDumpDir, then restore it
	// 한글: options.mDumpDir를 카탈로그한 뒤 복원
	RestoreSummary Run();

	// English: Restore an already built file set
	// 한글: 이미 만들어진 파일 집합 복원
	RestoreSummary Run(DumpFileSet files);

	const RestoreProgress &GetProgress() const { return mProgress; }

	// English: Table file order used by the last data phase (after shuffle)
	// 한글: 마지막 데이터 단계에서 사용된 테이블 파일 순서 (셔플 후)
	const std::vector<std::string> &GetDispatchOrder() const { return mDispatchOrder; }

  private:
	void ValidateTableNames(const std::vector<std::string> &tables) const;
	void RestoreSchemas(const DumpFileSet &files);
	void RestoreTables(const std::vector<std::string> &tables);

  private:
	Database::IConnectionPool &mPool;
	RestoreOptions mOptions;
	RestoreProgress mProgress;
	std::vector<std::string> mDispatchOrder;
};

} // namespace Restore
} // namespace DumpLoader
