#pragma once

// English: Dump file reading, statement splitting and execution helpers
// 한글: 덤프 파일 읽기, 구문 분리 및 실행 헬퍼

#include "Interfaces/IConnection.h"
#include "Interfaces/RestoreException.h"
#include <string>
#include <vector>

namespace DumpLoader
{
namespace Restore
{

class SqlScript
{
  public:
	// English: Statement separator: a semicolon immediately followed by a newline
	// 한글: 구문 구분자: 세미콜론 바로 뒤에 개행
	static constexpr const char *kStatementSeparator = ";\n";

	// English: Read the whole file (binary). Throws RestoreException with the path.
	// 한글: 파일 전체 읽기 (바이너리). 실패 시 경로와 함께 RestoreException 발생.
	static std::string ReadFile(const std::string &path);

	// English: Split on the separator and keep only executable statements
	// 한글: 구분자로 분리하고 실행할 구문만 유지
	static std::vector<std::string> SplitStatements(const std::string &text);

	// English: False for blank pieces and pieces that start with "/*"
	// 한글: 빈 조각과 "/*"로 시작하는 조각은 false
	static bool IsExecutable(const std::string &statement);

	static std::string UseDatabase(const std::string &database);

	// English: Execute one SQL text. DatabaseException is rethrown as
	//          RestoreException carrying the context and a statement excerpt.
	// 한글: SQL 텍스트 하나 실행. DatabaseException은 컨텍스트와 구문 일부를
	//       포함한 RestoreException으로 다시 던짐.
	static void Execute(Database::IConnection &connection, const std::string &sql,
						const RestoreException::Context &context);

  private:
	static std::string Excerpt(const std::string &sql);
};

} // namespace Restore
} // namespace DumpLoader
