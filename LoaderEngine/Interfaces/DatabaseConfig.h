#pragma once

// English: Database configuration structure
// 한글: 데이터베이스 설정 구조체

#include "DatabaseType_enum.h"
#include <cstdint>
#include <sstream>
#include <string>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: DatabaseConfig structure
// 한글: DatabaseConfig 구조체
// =============================================================================

/**
 * English: Database configuration structure
 * 한글: 데이터베이스 설정 구조체
 */
struct DatabaseConfig
{
	// English: Connection string (built by BuildODBCConnectionString when empty)
	// 한글: 연결 문자열 (비어 있으면 BuildODBCConnectionString으로 생성)
	std::string mConnectionString;

	// English: Database type
	// 한글: 데이터베이스 타입
	DatabaseType mType = DatabaseType::ODBC;

	// English: Connection (login) timeout in seconds
	// 한글: 연결(로그인) 타임아웃 (초)
	int mConnectionTimeout = 30;

	// English: Command timeout in seconds (0 = no timeout; restore statements never time out)
	// 한글: 명령 타임아웃 (초, 0 = 없음; 복원 구문은 타임아웃 없음)
	int mCommandTimeout = 0;

	// English: Fixed pool size (= worker thread count)
	// 한글: 고정 풀 크기 (= 워커 스레드 수)
	int mPoolSize = 16;

	// English: Server host / port / credentials for the connection string helper
	// 한글: 연결 문자열 헬퍼용 서버 호스트 / 포트 / 인증 정보
	std::string mHost     = "127.0.0.1";
	uint16_t    mPort     = 3306;   // MySQL default
	std::string mUser     = "root";
	std::string mPassword;
	std::string mDriver   = "MySQL ODBC 8.0 Unicode Driver";

	// ─── Connection string helpers ───────────────────────────────────────────
	// Example ODBC (MySQL Connector/ODBC):
	//   Driver={MySQL ODBC 8.0 Unicode Driver};Server=127.0.0.1;Port=3306;
	//   UID=root;PWD=secret;MULTI_STATEMENTS=1;
	// MULTI_STATEMENTS lets a "-schema-create.sql" file run as one batch.
	std::string BuildODBCConnectionString() const
	{
		std::ostringstream ss;
		ss << "Driver=" << QuoteODBCValue(mDriver, true) << ";"
		   << "Server=" << QuoteODBCValue(mHost) << ";"
		   << "Port=" << mPort << ";"
		   << "UID=" << QuoteODBCValue(mUser) << ";"
		   << "PWD=" << QuoteODBCValue(mPassword) << ";"
		   << "MULTI_STATEMENTS=1;";
		return ss.str();
	}

	// English: Brace-quote a value holding ';', '{', '}' or '=' (or always, for Driver);
	//          a '}' inside braces is written as "}}"
	// 한글: ';', '{', '}', '='가 있는 값 (Driver는 항상)을 중괄호로 감쌈;
	//       중괄호 안의 '}'는 "}}"로 기록
	static std::string QuoteODBCValue(const std::string &value, bool always = false)
	{
		if (!always && value.find_first_of(";{}=") == std::string::npos)
		{
			return value;
		}

		std::string quoted = "{";
		for (char c : value)
		{
			quoted += c;
			if (c == '}')
			{
				quoted += '}';
			}
		}
		quoted += '}';
		return quoted;
	}

	// English: Connection string actually handed to the driver
	// 한글: 드라이버에 실제로 전달되는 연결 문자열
	std::string GetConnectionString() const
	{
		return mConnectionString.empty() ? BuildODBCConnectionString() : mConnectionString;
	}
};

} // namespace Database
} // namespace DumpLoader
