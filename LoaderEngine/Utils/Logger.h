#pragma once

// English: Logging utility
// 한글: 로깅 유틸리티

#include "StringUtils.h"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace DumpLoader::Utils
{
// =============================================================================
// English: Log levels
// 한글: 로그 레벨
// =============================================================================

enum class LogLevel : int
{
	Debug = 0,
	Info = 1,
	Warn = 2,
	Err = 3
};

// =============================================================================
// English: Logger - process-wide logging with levels (console + optional file)
// 한글: Logger - 프로세스 전역 레벨별 로깅 (콘솔 + 선택적 파일)
// =============================================================================

class Logger
{
public:
	// English: Set minimum log level
	// 한글: 최소 로그 레벨 설정
	static void SetLevel(LogLevel level) { sCurrentLevel.store(level); }

	static LogLevel GetLevel() { return sCurrentLevel.load(); }

	// English: Parse "DEBUG" / "INFO" / "WARN" / "ERROR" (case-insensitive)
	// 한글: "DEBUG" / "INFO" / "WARN" / "ERROR" 파싱 (대소문자 무시)
	// @return false if the name is not a known level
	static bool ParseLevel(const std::string &name, LogLevel &outLevel)
	{
		const std::string upper = StringUtils::ToUpper(StringUtils::Trim(name));
		if (upper == "DEBUG")
			outLevel = LogLevel::Debug;
		else if (upper == "INFO")
			outLevel = LogLevel::Info;
		else if (upper == "WARN")
			outLevel = LogLevel::Warn;
		else if (upper == "ERROR")
			outLevel = LogLevel::Err;
		else
			return false;
		return true;
	}

	// English: Set log file path and open file for writing
	// 한글: 로그 파일 경로 설정 및 쓰기용 파일 열기
	// @return false if the file could not be opened
	static bool SetLogFile(const std::string &filename)
	{
		std::lock_guard<std::mutex> lock(sMutex);
		sLogFile = filename;

		// English: Open log file in append mode
		// 한글: 추가 모드로 로그 파일 열기
		if (!filename.empty())
		{
			sLogFileStream = std::make_unique<std::ofstream>(filename, std::ios::app);
			if (!sLogFileStream->is_open())
			{
				sLogFileStream.reset();
				std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
				return false;
			}
		}
		else
		{
			sLogFileStream.reset();
		}
		return true;
	}

	static void Debug(const std::string &message) { WriteLog(LogLevel::Debug, message); }

	static void Info(const std::string &message) { WriteLog(LogLevel::Info, message); }

	static void Warn(const std::string &message) { WriteLog(LogLevel::Warn, message); }

	static void Error(const std::string &message) { WriteLog(LogLevel::Err, message); }

	// English: Flush output buffer
	// 한글: 출력 버퍼 플러시
	static void Flush()
	{
		std::lock_guard<std::mutex> lock(sMutex);
		std::cout.flush();
		if (sLogFileStream)
		{
			sLogFileStream->flush();
		}
	}

private:
	static inline std::atomic<LogLevel> sCurrentLevel{LogLevel::Info};
	static inline std::string sLogFile;
	static inline std::unique_ptr<std::ofstream> sLogFileStream;
	static inline std::mutex sMutex;

	// English: Write log message with level check to console and file
	// 한글: 레벨 확인 후 콘솔과 파일에 로그 메시지 작성
	static void WriteLog(LogLevel level, const std::string &message)
	{
		if (static_cast<int>(level) < static_cast<int>(sCurrentLevel.load()))
		{
			return;
		}

		std::string formatted = FormatMessage(level, message);

		std::lock_guard<std::mutex> lock(sMutex);

		// English: Errors go to stderr so they survive stdout redirection
		// 한글: 오류는 stdout 리다이렉션과 무관하게 stderr로 출력
		if (level == LogLevel::Err)
		{
			std::cerr << formatted << std::endl;
		}
		else
		{
			std::cout << formatted << '\n';
		}

		if (sLogFileStream && sLogFileStream->is_open())
		{
			*sLogFileStream << formatted << '\n';
		}
	}

	// English: Format log message with timestamp and level
	// 한글: 타임스탬프와 레벨로 로그 메시지 포맷
	static std::string FormatMessage(LogLevel level, const std::string &message)
	{
		const char *levelStr = "???";
		switch (level)
		{
		case LogLevel::Debug:
			levelStr = "DEBUG";
			break;
		case LogLevel::Info:
			levelStr = "INFO";
			break;
		case LogLevel::Warn:
			levelStr = "WARN";
			break;
		case LogLevel::Err:
			levelStr = "ERROR";
			break;
		}

		auto now = std::chrono::system_clock::now();
		auto time = std::chrono::system_clock::to_time_t(now);

		char timeStr[32];
		std::tm localTime;
#ifdef _WIN32
		localtime_s(&localTime, &time);
#else
		localtime_r(&time, &localTime);
#endif
		std::strftime(timeStr, sizeof(timeStr), "%H:%M:%S", &localTime);

		std::string result;
		result.reserve(64 + message.size());
		result.append("[").append(timeStr).append("] [").append(levelStr).append("] ").append(message);
		return result;
	}
};

} // namespace DumpLoader::Utils
