// English: LoaderOptions + ConfigManager test suite (flags, config file, validation).
//          No GTest dependency - uses std::cout.
// 한글: LoaderOptions + ConfigManager 테스트 (플래그, 설정 파일, 검증).
//       GTest 미사용, std::cout 기반.

#include "../Common/TempDumpDir.h"
#include "LoaderOptions.h"
#include "Utils/ConfigManager.h"
#include "Utils/Logger.h"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using DumpLoader::LoaderOptions;
using DumpLoader::Tests::TempDumpDir;
using DumpLoader::Utils::ConfigManager;

static int gPassed = 0, gFailed = 0;

static void Pass(const char *name)
{
    std::cout << "[PASS] " << name << "\n";
    ++gPassed;
}

static void Fail(const char *name, const std::string &reason)
{
    std::cout << "[FAIL] " << name << " - " << reason << "\n";
    ++gFailed;
}

static LoaderOptions::ParseResult ParseArgs(const std::vector<std::string> &args, LoaderOptions &options,
                                            std::string &error)
{
    std::vector<const char *> argv{"dumploader"};
    for (const auto &arg : args)
        argv.push_back(arg.c_str());
    return LoaderOptions::Parse(static_cast<int>(argv.size()), argv.data(), options, error);
}

// -----------------------------------------------------------------------
void TestDefaults()
{
    const char *name = "Defaults";
    LoaderOptions options;
    std::string error;
    if (ParseArgs({"-d", "/tmp/dump"}, options, error) != LoaderOptions::ParseResult::Run)
    {
        Fail(name, error);
        return;
    }

    const auto &c = options.mConfig;
    if (c.host != "127.0.0.1" || c.port != 3306 || c.user != "root" || !c.password.empty())
        Fail(name, "server defaults");
    else if (c.threads != 16 || c.intervalMs != 10000 || c.dumpDir != "/tmp/dump")
        Fail(name, "restore defaults");
    else if (c.odbcDriver != "MySQL ODBC 8.0 Unicode Driver" || c.databaseType != "odbc" || options.mDryRun)
        Fail(name, "backend defaults");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestAllFlags()
{
    const char *name = "AllFlags";
    LoaderOptions options;
    std::string error;
    const auto result = ParseArgs({"-h", "db.example", "-P", "3307", "-u", "loader", "-p", "s3cret", "-d", "/data/dump",
                                   "-t", "8", "-i", "500", "-D", "MariaDB ODBC 3.1 Driver", "-l", "debug", "-L",
                                   "/tmp/loader.log", "--seed", "99"},
                                  options, error);
    if (result != LoaderOptions::ParseResult::Run)
    {
        Fail(name, error);
        return;
    }

    const auto dbConfig = options.ToDatabaseConfig();
    const auto restoreOptions = options.ToRestoreOptions();
    const std::string connStr = dbConfig.GetConnectionString();

    if (dbConfig.mHost != "db.example" || dbConfig.mPort != 3307 || dbConfig.mUser != "loader" ||
        dbConfig.mPassword != "s3cret")
        Fail(name, "server settings");
    else if (dbConfig.mPoolSize != 8 || dbConfig.mType != DumpLoader::Database::DatabaseType::ODBC)
        Fail(name, "pool size must equal the thread count");
    else if (restoreOptions.mDumpDir != "/data/dump" || restoreOptions.mProgressIntervalMs != 500 ||
             restoreOptions.mShuffleSeed != 99)
        Fail(name, "restore options");
    else if (options.mConfig.logLevel != "debug" || options.mConfig.logFile != "/tmp/loader.log")
        Fail(name, "log settings");
    else if (connStr.find("Driver={MariaDB ODBC 3.1 Driver};") == std::string::npos ||
             connStr.find("Server=db.example;Port=3307;") == std::string::npos ||
             connStr.find("MULTI_STATEMENTS=1;") == std::string::npos)
        Fail(name, "connection string: " + connStr);
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestCredentialsQuoted()
{
    const char *name = "CredentialsQuoted";
    LoaderOptions options;
    std::string error;
    const auto result =
        ParseArgs({"-d", "/x", "-u", "ro}ot", "-p", "se;cret", "-D", "Odd {Driver}"}, options, error);
    if (result != LoaderOptions::ParseResult::Run)
    {
        Fail(name, error);
        return;
    }

    const std::string connStr = options.ToDatabaseConfig().GetConnectionString();
    if (connStr != "Driver={Odd {Driver}}};Server=127.0.0.1;Port=3306;UID={ro}}ot};PWD={se;cret};"
                   "MULTI_STATEMENTS=1;")
        Fail(name, "connection string: " + connStr);
    else if (DumpLoader::Database::DatabaseConfig::QuoteODBCValue("a=b") != "{a=b}" ||
             DumpLoader::Database::DatabaseConfig::QuoteODBCValue("plain") != "plain")
        Fail(name, "value quoting");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestConfigFileThenFlags()
{
    const char *name = "ConfigFileThenFlags";
    TempDumpDir dir("config");
    const std::string file = dir.Write("loader.conf", "# restore settings\n"
                                                      "; old style comment\n"
                                                      "\n"
                                                      "host = 10.0.0.5\n"
                                                      "threads=4\n"
                                                      "dumpDir=/from/file\n"
                                                      "intervalMs=250\n"
                                                      "compression=zstd\n");
    LoaderOptions options;
    std::string error;
    // English: -t appears before -c on purpose; flags win regardless of position
    // 한글: 일부러 -t를 -c 앞에 둠; 위치와 무관하게 플래그가 우선
    const auto result = ParseArgs({"-t", "12", "-c", file}, options, error);
    if (result != LoaderOptions::ParseResult::Run)
    {
        Fail(name, error);
        return;
    }

    const auto &c = options.mConfig;
    if (c.host != "10.0.0.5" || c.dumpDir != "/from/file" || c.intervalMs != 250)
        Fail(name, "config file values not applied");
    else if (c.threads != 12)
        Fail(name, "flag must override the config file");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestConfigFileErrors()
{
    const char *name = "ConfigFileErrors";
    TempDumpDir dir("configbad");
    const std::string badValue = dir.Write("bad.conf", "threads=many\n");
    const std::string noEquals = dir.Write("noeq.conf", "dumpDir\n");

    ConfigManager::Config config;
    std::string error;
    if (ConfigManager::LoadFromFile(badValue, config, error) || error.find("bad.conf:1") == std::string::npos)
    {
        Fail(name, "bad value must fail with file:line, got '" + error + "'");
        return;
    }
    error.clear();
    if (ConfigManager::LoadFromFile(noEquals, config, error) || error.empty())
    {
        Fail(name, "line without '=' must fail");
        return;
    }
    error.clear();
    if (ConfigManager::LoadFromFile(dir.PathOf("missing.conf"), config, error) || error.empty())
    {
        Fail(name, "missing file must fail");
        return;
    }

    LoaderOptions options;
    if (ParseArgs({"-c", badValue, "-d", "/x"}, options, error) != LoaderOptions::ParseResult::Error)
        Fail(name, "Parse must report a config file error");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestBadArguments()
{
    const char *name = "BadArguments";
    struct Case
    {
        std::vector<std::string> args;
        const char *why;
    };
    const std::vector<Case> cases = {
        {{"-d", "/x", "--verbose"}, "unknown option"},
        {{"-d"}, "missing value"},
        {{"-d", "/x", "-t", "abc"}, "non-numeric threads"},
        {{"-d", "/x", "-t", "-3"}, "negative threads"},
        {{"-d", "/x", "-P", "70000"}, "port out of range"},
        {{"-d", "/x", "-t", "0"}, "zero threads"},
        {{"-d", "/x", "-i", "0"}, "zero interval"},
        {{"-d", "/x", "-l", "chatty"}, "unknown log level"},
        {{"-t", "4"}, "missing dump directory"},
    };

    for (const auto &c : cases)
    {
        LoaderOptions options;
        std::string error;
        if (ParseArgs(c.args, options, error) != LoaderOptions::ParseResult::Error || error.empty())
        {
            Fail(name, std::string("accepted: ") + c.why);
            return;
        }
    }
    Pass(name);
}

// -----------------------------------------------------------------------
void TestHelpAndDryRun()
{
    const char *name = "HelpAndDryRun";
    LoaderOptions options;
    std::string error;
    if (ParseArgs({"-t", "0", "--help"}, options, error) != LoaderOptions::ParseResult::ShowHelp)
    {
        Fail(name, "--help must win over other arguments");
        return;
    }

    if (ParseArgs({"-d", "/x", "--dry-run", "-t", "3"}, options, error) != LoaderOptions::ParseResult::Run)
    {
        Fail(name, error);
        return;
    }

    std::ostringstream usage;
    LoaderOptions::PrintUsage(usage, "dumploader");

    if (!options.mDryRun || options.ToDatabaseConfig().mType != DumpLoader::Database::DatabaseType::Mock)
        Fail(name, "--dry-run must select the mock backend");
    else if (usage.str().find("--dry-run") == std::string::npos || usage.str().find("-d <dir>") == std::string::npos)
        Fail(name, "usage text");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestValidateConfig()
{
    const char *name = "ValidateConfig";
    ConfigManager::Config config = ConfigManager::GetDefault();
    std::string reason;

    const bool emptyDirRejected = !ConfigManager::ValidateConfig(config, reason);
    config.dumpDir = "/x";
    const bool validAccepted = ConfigManager::ValidateConfig(config, reason);
    config.databaseType = "oracle";
    const bool typeRejected = !ConfigManager::ValidateConfig(config, reason);
    const std::string typeReason = reason;
    config.databaseType = "MOCK";
    const bool mockAccepted = ConfigManager::ValidateConfig(config, reason);

    if (!emptyDirRejected)
        Fail(name, "empty dumpDir");
    else if (!validAccepted)
        Fail(name, "default config with a dump dir must validate");
    else if (!typeRejected || typeReason.find("oracle") == std::string::npos)
        Fail(name, "unknown databaseType");
    else if (!mockAccepted)
        Fail(name, "databaseType is case-insensitive");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
int main()
{
    DumpLoader::Utils::Logger::SetLevel(DumpLoader::Utils::LogLevel::Err);

    std::cout << "=== LoaderOptions Tests ===\n";
    TestDefaults();
    TestAllFlags();
    TestCredentialsQuoted();
    TestConfigFileThenFlags();
    TestConfigFileErrors();
    TestBadArguments();
    TestHelpAndDryRun();
    TestValidateConfig();

    std::cout << "\nResult: " << gPassed << " passed, " << gFailed << " failed\n";
    return gFailed > 0 ? 1 : 0;
}
