// English: dumploader entry point - restores a dump directory through a connection pool
// 한글: dumploader 진입점 - 연결 풀을 통해 덤프 디렉터리 복원

#include "Database/ConnectionPool.h"
#include "Interfaces/DatabaseException.h"
#include "Interfaces/RestoreException.h"
#include "LoaderOptions.h"
#include "Restore/RestoreOrchestrator.h"
#include "Utils/Logger.h"
#include <exception>
#include <iostream>
#include <string>

using DumpLoader::LoaderOptions;
using DumpLoader::Utils::Logger;

int main(int argc, char *argv[])
{
	LoaderOptions options;
	std::string error;

	switch (LoaderOptions::Parse(argc, argv, options, error))
	{
	case LoaderOptions::ParseResult::ShowHelp:
		LoaderOptions::PrintUsage(std::cout, argv[0]);
		return 0;
	case LoaderOptions::ParseResult::Error:
		std::cerr << "Error: " << error << std::endl;
		LoaderOptions::PrintUsage(std::cerr, argv[0]);
		return 1;
	case LoaderOptions::ParseResult::Run:
		break;
	}

	// English: Setup logging
	// 한글: 로깅 설정
	DumpLoader::Utils::LogLevel level = DumpLoader::Utils::LogLevel::Info;
	Logger::ParseLevel(options.mConfig.logLevel, level);
	Logger::SetLevel(level);
	if (!options.mConfig.logFile.empty() && !Logger::SetLogFile(options.mConfig.logFile))
	{
		return 1;
	}

	const DumpLoader::Database::DatabaseConfig dbConfig = options.ToDatabaseConfig();
	Logger::Info("loader.start.dir[" + options.mConfig.dumpDir + "].threads[" +
				 std::to_string(options.mConfig.threads) + "].backend[" +
				 DumpLoader::Database::ToString(dbConfig.mType) + "].server[" + dbConfig.mHost + ":" +
				 std::to_string(dbConfig.mPort) + "]");

	// English: Every connection is opened here, before any restore work
	// 한글: 모든 연결은 복원 작업 전에 여기서 열림
	DumpLoader::Database::ConnectionPool pool;
	if (!pool.Initialize(dbConfig))
	{
		Logger::Error("Failed to initialize connection pool");
		Logger::Flush();
		return 1;
	}

	int exitCode = 0;
	try
	{
		DumpLoader::Restore::RestoreOrchestrator orchestrator(pool, options.ToRestoreOptions());
		const DumpLoader::Restore::RestoreSummary summary = orchestrator.Run();

		Logger::Info("loader.done.databases[" + std::to_string(summary.mDatabaseCount) + "].schemas[" +
					 std::to_string(summary.mSchemaCount) + "].tables[" +
					 std::to_string(summary.mTableCount) + "].bytes[" +
					 std::to_string(summary.mTotalBytes) + "]");
	}
	catch (const DumpLoader::Restore::RestoreException &e)
	{
		Logger::Error(e.what());
		exitCode = 1;
	}
	catch (const DumpLoader::Database::DatabaseException &e)
	{
		Logger::Error(std::string("database error: ") + e.what() + " (" + e.DescribeCode() + ")");
		exitCode = 1;
	}
	catch (const std::exception &e)
	{
		Logger::Error(std::string("unexpected error: ") + e.what());
		exitCode = 1;
	}

	pool.Shutdown();
	Logger::Flush();
	return exitCode;
}
