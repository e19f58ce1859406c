#pragma once

// English: Command line options of the dumploader executable
// 한글: dumploader 실행 파일의 커맨드라인 옵션

#include "Interfaces/DatabaseConfig.h"
#include "Restore/RestoreOrchestrator.h"
#include "Utils/ConfigManager.h"
#include <cstdint>
#include <ostream>
#include <string>

namespace DumpLoader
{

// =============================================================================
// English: LoaderOptions class
// 한글: LoaderOptions 클래스
// =============================================================================

/**
 * English: A "-c <file>" config file is applied first, then every other flag on
 *          top of it, then ConfigManager::ValidateConfig. "-h" is the host, as in
 *          the mydumper tool family; help is "--help" only.
 * 한글: "-c <file>" 설정 파일을 먼저 적용하고, 그 위에 나머지 플래그를 적용한 뒤
 *       ConfigManager::ValidateConfig로 검증. mydumper 계열 도구처럼 "-h"는 호스트이며,
 *       도움말은 "--help"만 사용.
 */
class LoaderOptions
{
  public:
	enum class ParseResult
	{
		Run,
		ShowHelp,
		Error
	};

	static ParseResult Parse(int argc, const char *const argv[], LoaderOptions &outOptions,
							 std::string &error);

	static void PrintUsage(std::ostream &out, const char *programName);

	Database::DatabaseConfig ToDatabaseConfig() const;
	Restore::RestoreOptions ToRestoreOptions() const;

  public:
	Utils::ConfigManager::Config mConfig;
	bool mDryRun = false;
	uint32_t mShuffleSeed = 0;
};

} // namespace DumpLoader
