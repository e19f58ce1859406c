#pragma once

// English: Replays database-creation and table-definition files on one connection
// 한글: 하나의 연결에서 데이터베이스 생성 및 테이블 정의 파일 재생

#include "Interfaces/IConnection.h"
#include <string>
#include <vector>

namespace DumpLoader
{
namespace Restore
{

// =============================================================================
// English: SchemaRestorer class
// 한글: SchemaRestorer 클래스
// =============================================================================

/**
 * English: Both phases run in list order and stop at the first failure
 *          (RestoreException). There is no partial success.
 * 한글: 두 단계 모두 목록 순서대로 실행되며 첫 실패에서 중단 (RestoreException).
 *       부분 성공은 없음.
 */
class SchemaRestorer
{
  public:
	// English: Each file is executed as one batch ("CREATE DATABASE ...")
	// 한글: 각 파일을 하나의 배치로 실행 ("CREATE DATABASE ...")
	static void RestoreDatabaseSchemas(Database::IConnection &connection,
									   const std::vector<std::string> &databasePaths);

	// English: USE `<db>`, then every executable statement of the file in order
	// 한글: USE `<db>` 후 파일의 실행 가능한 모든 구문을 순서대로 실행
	static void RestoreTableSchemas(Database::IConnection &connection,
									const std::vector<std::string> &schemaPaths);
};

} // namespace Restore
} // namespace DumpLoader
