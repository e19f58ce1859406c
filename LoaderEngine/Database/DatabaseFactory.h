#pragma once

// English: Database factory for creating database instances
// 한글: 데이터베이스 인스턴스 생성용 팩토리

#include "../Interfaces/DatabaseType_enum.h"
#include "../Interfaces/IDatabase.h"
#include <memory>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: DatabaseFactory class
// 한글: DatabaseFactory 클래스
// =============================================================================

class DatabaseFactory
{
  public:
	// English: Create database by type (throws DatabaseException on unknown type)
	// 한글: 타입별 데이터베이스 생성 (알 수 없는 타입이면 DatabaseException 발생)
	static std::unique_ptr<IDatabase> CreateDatabase(DatabaseType type);

	// English: Convenience methods
	// 한글: 편의 메서드
	static std::unique_ptr<IDatabase> CreateODBCDatabase();
	static std::unique_ptr<IDatabase> CreateMockDatabase();
};

} // namespace Database
} // namespace DumpLoader
