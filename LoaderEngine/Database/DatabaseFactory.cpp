// English: DatabaseFactory implementation
// 한글: DatabaseFactory 구현

#include "DatabaseFactory.h"
#include "../Interfaces/DatabaseException.h"
#include "MockDatabase.h"
#include "ODBCDatabase.h"

namespace DumpLoader
{
namespace Database
{

std::unique_ptr<IDatabase> DatabaseFactory::CreateDatabase(DatabaseType type)
{
	switch (type)
	{
	case DatabaseType::ODBC:
		return CreateODBCDatabase();
	case DatabaseType::Mock:
		return CreateMockDatabase();
	}
	throw DatabaseException("Unsupported database type");
}

std::unique_ptr<IDatabase> DatabaseFactory::CreateODBCDatabase()
{
	return std::make_unique<ODBCDatabase>();
}

std::unique_ptr<IDatabase> DatabaseFactory::CreateMockDatabase()
{
	return std::make_unique<MockDatabase>();
}

} // namespace Database
} // namespace DumpLoader
