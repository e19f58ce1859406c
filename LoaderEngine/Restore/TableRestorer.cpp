// English: TableRestorer implementation
// 한글: TableRestorer 구현

#include "TableRestorer.h"
#include "DumpCatalog.h"
#include "SqlScript.h"
#include "Utils/Logger.h"

namespace DumpLoader
{
namespace Restore
{

uint64_t TableRestorer::RestoreTable(Database::IConnection &connection, const std::string &tablePath)
{
	const TableIdentity identity = DumpCatalog::ParseTableIdentity(tablePath);

	RestoreException::Context context;
	context.mFile = tablePath;
	context.mDatabase = identity.mDatabase;
	context.mTable = identity.mTable;
	context.mPart = identity.GetPartLabel();
	context.mConnectionId = connection.GetId();

	const std::string key = "restoring.tables[" + identity.mTable + "].parts[" + context.mPart +
							"].thread[" + std::to_string(connection.GetId()) + "]";
	Utils::Logger::Info(key);

	SqlScript::Execute(connection, SqlScript::UseDatabase(identity.mDatabase), context);

	const std::string text = SqlScript::ReadFile(tablePath);
	for (const auto &statement : SqlScript::SplitStatements(text))
	{
		SqlScript::Execute(connection, statement, context);
	}

	Utils::Logger::Info(key + ".done...");
	return static_cast<uint64_t>(text.size());
}

} // namespace Restore
} // namespace DumpLoader
