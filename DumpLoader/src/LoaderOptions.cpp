// English: LoaderOptions implementation
// 한글: LoaderOptions 구현

#include "LoaderOptions.h"
#include <limits>
#include <stdexcept>

namespace DumpLoader
{

using Utils::ConfigManager;

namespace
{

// English: Flags that consume the next argument
// 한글: 다음 인자를 값으로 사용하는 플래그
bool TakesValue(const std::string &arg)
{
	return arg == "-h" || arg == "-P" || arg == "-u" || arg == "-p" || arg == "-d" || arg == "-t" ||
		   arg == "-i" || arg == "-c" || arg == "-D" || arg == "-l" || arg == "-L" || arg == "--seed";
}

} // namespace

LoaderOptions::ParseResult LoaderOptions::Parse(int argc, const char *const argv[],
												LoaderOptions &outOptions, std::string &error)
{
	LoaderOptions options;

	// English: Pass 1 - help, value presence, and the config file
	// 한글: 1단계 - 도움말, 값 존재 여부, 설정 파일
	std::string configFile;
	for (int i = 1; i < argc; ++i)
	{
		const std::string arg = argv[i];
		if (arg == "--help")
		{
			return ParseResult::ShowHelp;
		}
		if (TakesValue(arg))
		{
			if (i + 1 >= argc)
			{
				error = "option " + arg + " requires a value";
				return ParseResult::Error;
			}
			if (arg == "-c")
			{
				configFile = argv[i + 1];
			}
			++i;
		}
	}

	if (!configFile.empty() && !ConfigManager::LoadFromFile(configFile, options.mConfig, error))
	{
		return ParseResult::Error;
	}

	// English: Pass 2 - flags override the config file
	// 한글: 2단계 - 플래그가 설정 파일을 덮어씀
	Utils::ConfigManager::Config &config = options.mConfig;
	for (int i = 1; i < argc; ++i)
	{
		const std::string arg = argv[i];
		try
		{
			if (arg == "-h")
				config.host = argv[++i];
			else if (arg == "-P")
				config.port = static_cast<uint16_t>(ConfigManager::ParseUnsigned(argv[++i], 65535));
			else if (arg == "-u")
				config.user = argv[++i];
			else if (arg == "-p")
				config.password = argv[++i];
			else if (arg == "-d")
				config.dumpDir = argv[++i];
			else if (arg == "-t")
				config.threads = static_cast<size_t>(ConfigManager::ParseUnsigned(argv[++i], 4096));
			else if (arg == "-i")
				config.intervalMs = static_cast<uint32_t>(
					ConfigManager::ParseUnsigned(argv[++i], std::numeric_limits<uint32_t>::max()));
			else if (arg == "-c")
				++i; // applied in pass 1
			else if (arg == "-D")
				config.odbcDriver = argv[++i];
			else if (arg == "-l")
				config.logLevel = argv[++i];
			else if (arg == "-L")
				config.logFile = argv[++i];
			else if (arg == "--seed")
				options.mShuffleSeed = static_cast<uint32_t>(
					ConfigManager::ParseUnsigned(argv[++i], std::numeric_limits<uint32_t>::max()));
			else if (arg == "--dry-run")
				options.mDryRun = true;
			else
			{
				error = "unknown option: " + arg;
				return ParseResult::Error;
			}
		}
		catch (const std::exception &e)
		{
			error = "bad value for " + arg + ": " + e.what();
			return ParseResult::Error;
		}
	}

	if (options.mDryRun)
	{
		config.databaseType = "mock";
	}

	std::string reason;
	if (!ConfigManager::ValidateConfig(config, reason))
	{
		error = "invalid configuration: " + reason;
		return ParseResult::Error;
	}

	outOptions = options;
	return ParseResult::Run;
}

void LoaderOptions::PrintUsage(std::ostream &out, const char *programName)
{
	out << "Usage: " << programName << " -d <dir> [options]" << std::endl;
	out << "Options:" << std::endl;
	out << "  -h <host>       Server host (default: 127.0.0.1)" << std::endl;
	out << "  -P <port>       Server port (default: 3306)" << std::endl;
	out << "  -u <user>       User name (default: root)" << std::endl;
	out << "  -p <password>   Password" << std::endl;
	out << "  -d <dir>        Dump directory (required)" << std::endl;
	out << "  -t <threads>    Worker threads = pooled connections (default: 16)" << std::endl;
	out << "  -i <ms>         Progress report interval in milliseconds (default: 10000)" << std::endl;
	out << "  -c <file>       key=value config file, applied before the other flags" << std::endl;
	out << "  -D <driver>     ODBC driver name (default: MySQL ODBC 8.0 Unicode Driver)" << std::endl;
	out << "  -l <level>      Log level: DEBUG, INFO, WARN, ERROR (default: INFO)" << std::endl;
	out << "  -L <file>       Also append log lines to this file" << std::endl;
	out << "  --seed <n>      Table shuffle seed, 0 = random (default: 0)" << std::endl;
	out << "  --dry-run       Use the in-memory backend; nothing is sent to a server" << std::endl;
	out << "  --help          Show this help" << std::endl;
}

Database::DatabaseConfig LoaderOptions::ToDatabaseConfig() const
{
	Database::DatabaseConfig dbConfig;
	if (!Database::ParseDatabaseType(mConfig.databaseType, dbConfig.mType))
	{
		throw std::invalid_argument("unknown databaseType '" + mConfig.databaseType + "'");
	}
	dbConfig.mHost = mConfig.host;
	dbConfig.mPort = mConfig.port;
	dbConfig.mUser = mConfig.user;
	dbConfig.mPassword = mConfig.password;
	dbConfig.mDriver = mConfig.odbcDriver;
	dbConfig.mPoolSize = static_cast<int>(mConfig.threads);
	return dbConfig;
}

Restore::RestoreOptions LoaderOptions::ToRestoreOptions() const
{
	Restore::RestoreOptions restoreOptions;
	restoreOptions.mDumpDir = mConfig.dumpDir;
	restoreOptions.mProgressIntervalMs = mConfig.intervalMs;
	restoreOptions.mShuffleSeed = mShuffleSeed;
	return restoreOptions;
}

} // namespace DumpLoader
