#pragma once

// English: Configuration management utility
// 한글: 설정 관리 유틸리티

#include "../Interfaces/DatabaseType_enum.h"
#include "Logger.h"
#include "StringUtils.h"
#include <cstdint>
#include <fstream>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace DumpLoader::Utils
{
// =============================================================================
// English: ConfigManager - loads and validates loader configuration
// 한글: ConfigManager - 로더 설정 로드 및 검증
// =============================================================================

class ConfigManager
{
public:
	// English: Configuration structure
	// 한글: 설정 구조체
	struct Config
	{
		// English: Server settings
		// 한글: 서버 설정
		std::string host = "127.0.0.1";
		uint16_t port = 3306;
		std::string user = "root";
		std::string password;
		std::string odbcDriver = "MySQL ODBC 8.0 Unicode Driver";
		std::string databaseType = "odbc";

		// English: Restore settings
		// 한글: 복원 설정
		size_t threads = 16;
		std::string dumpDir;
		uint32_t intervalMs = 10000;

		// English: Logging settings
		// 한글: 로깅 설정
		std::string logLevel = "INFO";
		std::string logFile;
	};

	// English: Load configuration from a key=value file on top of `config`.
	//          Unknown keys are reported at Warn level and skipped.
	// 한글: key=value 파일의 설정을 `config` 위에 덮어씀.
	//       알 수 없는 키는 Warn 레벨로 보고하고 건너뜀.
	// @param filename - Path to configuration file
	// @param config - In/out configuration
	// @param error - Receives a description on failure
	// @return false if the file cannot be opened or a value does not parse
	static bool LoadFromFile(const std::string &filename, Config &config, std::string &error)
	{
		std::ifstream file(filename);
		if (!file.is_open())
		{
			error = "cannot open config file: " + filename;
			return false;
		}

		// English: Create handler map for O(1) dispatch
		// 한글: O(1) 디스패치를 위한 핸들러 맵 생성
		std::unordered_map<std::string, std::function<void(const std::string &)>> handlers;
		handlers["host"] = [&](const std::string &v) { config.host = v; };
		handlers["port"] = [&](const std::string &v) { config.port = static_cast<uint16_t>(ParseUnsigned(v, 65535)); };
		handlers["user"] = [&](const std::string &v) { config.user = v; };
		handlers["password"] = [&](const std::string &v) { config.password = v; };
		handlers["odbcDriver"] = [&](const std::string &v) { config.odbcDriver = v; };
		handlers["databaseType"] = [&](const std::string &v) { config.databaseType = v; };
		handlers["threads"] = [&](const std::string &v) { config.threads = static_cast<size_t>(ParseUnsigned(v, 4096)); };
		handlers["dumpDir"] = [&](const std::string &v) { config.dumpDir = v; };
		handlers["intervalMs"] = [&](const std::string &v) {
			config.intervalMs = static_cast<uint32_t>(ParseUnsigned(v, std::numeric_limits<uint32_t>::max()));
		};
		handlers["logLevel"] = [&](const std::string &v) { config.logLevel = v; };
		handlers["logFile"] = [&](const std::string &v) { config.logFile = v; };

		std::string line;
		size_t lineNo = 0;
		while (std::getline(file, line))
		{
			++lineNo;

			// English: Skip empty lines and comments
			// 한글: 빈 줄과 주석 건너뛰기
			const std::string trimmed = StringUtils::Trim(line);
			if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
				continue;

			// English: Parse key=value pairs
			// 한글: key=value 쌍 파싱
			size_t pos = trimmed.find('=');
			if (pos == std::string::npos)
			{
				error = filename + ":" + std::to_string(lineNo) + ": expected key=value";
				return false;
			}

			std::string key = StringUtils::Trim(trimmed.substr(0, pos));
			std::string value = StringUtils::Trim(trimmed.substr(pos + 1));

			auto it = handlers.find(key);
			if (it == handlers.end())
			{
				Logger::Warn("ConfigManager: unknown key '" + key + "' in " + filename);
				continue;
			}

			try
			{
				it->second(value);
			}
			catch (const std::exception &e)
			{
				error = filename + ":" + std::to_string(lineNo) + ": bad value for '" + key +
						"': " + e.what();
				return false;
			}
		}

		return true;
	}

	// English: Get default configuration
	// 한글: 기본 설정 가져오기
	static Config GetDefault() { return Config{}; }

	// English: Validate configuration
	// 한글: 설정 유효성 검사
	// @param config - Configuration to validate
	// @param reason - Receives the first violated rule
	// @return true if configuration is valid
	static bool ValidateConfig(const Config &config, std::string &reason)
	{
		Database::DatabaseType type;
		LogLevel level;

		if (config.threads == 0)
			reason = "threads must be greater than 0";
		else if (config.dumpDir.empty())
			reason = "dump directory is required";
		else if (config.intervalMs == 0)
			reason = "intervalMs must be greater than 0";
		else if (config.port == 0)
			reason = "port must be greater than 0";
		else if (!Database::ParseDatabaseType(config.databaseType, type))
			reason = "unknown databaseType '" + config.databaseType + "'";
		else if (!Logger::ParseLevel(config.logLevel, level))
			reason = "unknown logLevel '" + config.logLevel + "'";
		else
			return true;
		return false;
	}

	// English: Strict unsigned parse: digits only, bounded by maxValue
	// 한글: 엄격한 부호 없는 정수 파싱: 숫자만 허용, maxValue 이하
	static unsigned long long ParseUnsigned(const std::string &value, unsigned long long maxValue)
	{
		if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
		{
			throw std::invalid_argument("not an unsigned integer: '" + value + "'");
		}
		unsigned long long parsed = std::stoull(value);
		if (parsed > maxValue)
		{
			throw std::out_of_range("value " + value + " exceeds " + std::to_string(maxValue));
		}
		return parsed;
	}
};

} // namespace DumpLoader::Utils
