#pragma once

// English: Database backend enumeration
// 한글: 데이터베이스 백엔드 열거형

#include "Utils/StringUtils.h"
#include <string>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: DatabaseType enumeration
// 한글: DatabaseType 열거형
// =============================================================================

enum class DatabaseType
{
	// English: ODBC (Open Database Connectivity) - production backend
	// 한글: ODBC (개방형 데이터베이스 연결) - 운영 백엔드
	ODBC,

	// English: In-memory statement recorder (tests, --dry-run)
	// 한글: 인메모리 구문 기록기 (테스트, --dry-run)
	Mock
};

// English: Parse "odbc" / "mock" (case-insensitive). Returns false on unknown names.
// 한글: "odbc" / "mock" 파싱 (대소문자 무시). 알 수 없는 이름이면 false 반환.
inline bool ParseDatabaseType(const std::string &name, DatabaseType &outType)
{
	const std::string lower = Utils::StringUtils::ToLower(Utils::StringUtils::Trim(name));
	if (lower == "odbc")
	{
		outType = DatabaseType::ODBC;
		return true;
	}
	if (lower == "mock")
	{
		outType = DatabaseType::Mock;
		return true;
	}
	return false;
}

inline const char *ToString(DatabaseType type)
{
	switch (type)
	{
	case DatabaseType::ODBC:
		return "odbc";
	case DatabaseType::Mock:
		return "mock";
	}
	return "unknown";
}

} // namespace Database
} // namespace DumpLoader
