// English: SchemaRestorer implementation
// 한글: SchemaRestorer 구현

#include "SchemaRestorer.h"
#include "DumpCatalog.h"
#include "SqlScript.h"
#include "Utils/Logger.h"

namespace DumpLoader
{
namespace Restore
{

using Utils::Logger;

void SchemaRestorer::RestoreDatabaseSchemas(Database::IConnection &connection,
											const std::vector<std::string> &databasePaths)
{
	for (const auto &path : databasePaths)
	{
		RestoreException::Context context;
		context.mFile = path;
		context.mDatabase = DumpCatalog::ParseDatabaseName(path);

		const std::string sql = SqlScript::ReadFile(path);
		SqlScript::Execute(connection, sql, context);

		Logger::Info("restoring.database[" + context.mDatabase + "]");
	}
}

void SchemaRestorer::RestoreTableSchemas(Database::IConnection &connection,
										 const std::vector<std::string> &schemaPaths)
{
	for (const auto &path : schemaPaths)
	{
		const TableIdentity identity = DumpCatalog::ParseTableSchemaIdentity(path);

		RestoreException::Context context;
		context.mFile = path;
		context.mDatabase = identity.mDatabase;
		context.mTable = identity.mTable;

		SqlScript::Execute(connection, SqlScript::UseDatabase(identity.mDatabase), context);

		const std::string text = SqlScript::ReadFile(path);
		for (const auto &statement : SqlScript::SplitStatements(text))
		{
			SqlScript::Execute(connection, statement, context);
		}

		const std::string name =
			identity.mTable.empty() ? identity.mDatabase : identity.mDatabase + "." + identity.mTable;
		Logger::Info("restoring.schema[" + name + "]");
	}
}

} // namespace Restore
} // namespace DumpLoader
