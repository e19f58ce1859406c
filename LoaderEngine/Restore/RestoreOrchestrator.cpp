// English: RestoreOrchestrator implementation
// 한글: RestoreOrchestrator 구현

#include "RestoreOrchestrator.h"
#include "Database/ConnectionPool.h"
#include "ProgressReporter.h"
#include "SchemaRestorer.h"
#include "TableRestorer.h"
#include "Utils/Logger.h"
#include "Utils/ThreadPool.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

namespace DumpLoader
{
namespace Restore
{

using Utils::Logger;

void ShuffleTables(std::vector<std::string> &tables, std::mt19937 &engine)
{
	for (size_t i = 1; i < tables.size(); ++i)
	{
		std::uniform_int_distribution<size_t> pick(0, i);
		const size_t j = pick(engine);
		std::swap(tables[i], tables[j]);
	}
}

RestoreOrchestrator::RestoreOrchestrator(Database::IConnectionPool &pool, RestoreOptions options)
	: mPool(pool), mOptions(std::move(options))
{
}

RestoreSummary RestoreOrchestrator::Run()
{
	return Run(DumpCatalog::Load(mOptions.mDumpDir));
}

RestoreSummary RestoreOrchestrator::Run(DumpFileSet files)
{
	// English: Phase 0 - a malformed table name aborts before any statement runs
	// 한글: 0단계 - 잘못된 테이블 이름은 어떤 구문도 실행되기 전에 중단
	ValidateTableNames(files.mTables);

	RestoreSchemas(files);

	const uint32_t seed = mOptions.mShuffleSeed != 0 ? mOptions.mShuffleSeed : std::random_device{}();
	Logger::Info("restoring.shuffle.seed[" + std::to_string(seed) + "]");
	std::mt19937 engine(seed);
	ShuffleTables(files.mTables, engine);
	mDispatchOrder = files.mTables;

	const auto start = std::chrono::steady_clock::now();
	RestoreTables(files.mTables);
	const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

	RestoreSummary summary;
	summary.mElapsedSeconds = elapsed.count();
	summary.mTotalBytes = mProgress.GetBytes();
	summary.mDatabaseCount = files.mDatabases.size();
	summary.mSchemaCount = files.mSchemas.size();
	summary.mTableCount = files.mTables.size();

	const double megabytes = RestoreProgress::ToMegabytes(summary.mTotalBytes);
	const double rate = summary.mElapsedSeconds > 0.0 ? megabytes / summary.mElapsedSeconds : 0.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << "restoring.all.done.cost[" << summary.mElapsedSeconds
		<< "sec].allbytes[" << megabytes << "MB].rate[" << rate << "MB/s]";
	Logger::Info(oss.str());

	return summary;
}

void RestoreOrchestrator::ValidateTableNames(const std::vector<std::string> &tables) const
{
	for (const auto &path : tables)
	{
		DumpCatalog::ParseTableIdentity(path);
	}
}

void RestoreOrchestrator::RestoreSchemas(const DumpFileSet &files)
{
	{
		Database::ScopedConnection conn(mPool.GetConnection(), &mPool);
		SchemaRestorer::RestoreDatabaseSchemas(*conn, files.mDatabases);
	}
	{
		Database::ScopedConnection conn(mPool.GetConnection(), &mPool);
		SchemaRestorer::RestoreTableSchemas(*conn, files.mSchemas);
	}
}

void RestoreOrchestrator::RestoreTables(const std::vector<std::string> &tables)
{
	const size_t workerCount = std::max<size_t>(1, mPool.GetPoolSize());

	std::atomic<bool> aborted(false);
	std::mutex errorMutex;
	std::exception_ptr firstError;

	auto recordFailure = [&](std::exception_ptr error) {
		std::lock_guard<std::mutex> lock(errorMutex);
		if (!firstError)
		{
			firstError = std::move(error);
		}
		aborted.store(true);
	};

	ProgressReporter reporter(mProgress, mOptions.mProgressIntervalMs);
	Utils::ThreadPool workers(workerCount);
	std::vector<std::future<void>> pending;
	pending.reserve(tables.size());

	reporter.Start(std::chrono::steady_clock::now());

	try
	{
		for (const auto &path : tables)
		{
			// English: Blocks while every connection is checked out
			// 한글: 모든 연결이 대여 중이면 블록
			Database::ScopedConnection conn(mPool.GetConnection(), &mPool);
			if (aborted.load())
			{
				break;
			}

			pending.push_back(workers.Submit(
				[this, &aborted, &recordFailure, path, conn = std::move(conn)]() mutable {
					// English: Returned to the pool when this task ends, on success or failure
					// 한글: 성공이든 실패든 이 작업이 끝나면 풀에 반환
					Database::ScopedConnection lease(std::move(conn));
					if (aborted.load())
					{
						return;
					}

					try
					{
						mProgress.AddTable(TableRestorer::RestoreTable(*lease, path));
					}
					catch (const std::exception &)
					{
						recordFailure(std::current_exception());
						throw;
					}
				}));
		}
	}
	catch (const std::exception &)
	{
		// English: Acquire failed; let running tasks finish before unwinding
		// 한글: 획득 실패; 되감기 전에 실행 중인 작업이 끝나도록 대기
		recordFailure(std::current_exception());
	}

	workers.WaitForAll();
	reporter.Stop();

	if (firstError)
	{
		Logger::Error("restoring.aborted.completed[" + std::to_string(mProgress.GetCompletedTables()) +
					  "/" + std::to_string(tables.size()) + "]");
		std::rethrow_exception(firstError);
	}

	for (auto &future : pending)
	{
		future.get();
	}
}

} // namespace Restore
} // namespace DumpLoader
