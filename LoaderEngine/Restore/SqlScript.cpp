// English: SqlScript implementation
// 한글: SqlScript 구현

#include "SqlScript.h"
#include "Interfaces/DatabaseException.h"
#include "Interfaces/IStatement.h"
#include "Utils/StringUtils.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace DumpLoader
{
namespace Restore
{

using Utils::StringUtils;

namespace
{

constexpr size_t kExcerptLength = 120;

} // namespace

std::string SqlScript::ReadFile(const std::string &path)
{
	std::ifstream file(path, std::ios::in | std::ios::binary);
	if (!file.is_open())
	{
		RestoreException::Context context;
		context.mFile = path;
		throw RestoreException(std::string("cannot open file: ") + std::strerror(errno), context);
	}

	std::ostringstream buffer;
	buffer << file.rdbuf();
	if (file.bad())
	{
		RestoreException::Context context;
		context.mFile = path;
		throw RestoreException("read error", context);
	}
	return buffer.str();
}

bool SqlScript::IsExecutable(const std::string &statement)
{
	return !StringUtils::IsEmpty(statement) && !StringUtils::StartsWith(statement, "/*");
}

std::vector<std::string> SqlScript::SplitStatements(const std::string &text)
{
	std::vector<std::string> statements;
	for (auto &piece : StringUtils::SplitByToken(text, kStatementSeparator))
	{
		if (IsExecutable(piece))
		{
			statements.push_back(std::move(piece));
		}
	}
	return statements;
}

std::string SqlScript::UseDatabase(const std::string &database)
{
	return "USE `" + database + "`";
}

std::string SqlScript::Excerpt(const std::string &sql)
{
	std::string excerpt = StringUtils::Trim(sql.size() > kExcerptLength ? sql.substr(0, kExcerptLength) : sql);
	std::replace(excerpt.begin(), excerpt.end(), '\n', ' ');
	if (sql.size() > kExcerptLength)
	{
		excerpt += "...";
	}
	return excerpt;
}

void SqlScript::Execute(Database::IConnection &connection, const std::string &sql,
						const RestoreException::Context &context)
{
	try
	{
		auto statement = connection.CreateStatement();
		statement->SetQuery(sql);
		statement->Execute();
	}
	catch (const Database::DatabaseException &e)
	{
		RestoreException::Context failed = context;
		failed.mConnectionId = connection.GetId();
		throw RestoreException(std::string(e.what()) + " (" + e.DescribeCode() + ") in statement: " + Excerpt(sql),
							   failed);
	}
}

} // namespace Restore
} // namespace DumpLoader
