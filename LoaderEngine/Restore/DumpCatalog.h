#pragma once

// English: Dump directory discovery and file-name parsing
// 한글: 덤프 디렉터리 탐색 및 파일 이름 파싱

#include <cstddef>
#include <string>
#include <vector>

namespace DumpLoader
{
namespace Restore
{

// =============================================================================
// English: File categories (checked in this priority order)
// 한글: 파일 분류 (이 우선순위 순서로 검사)
// =============================================================================

enum class FileCategory : int
{
	DatabaseSchema = 0, // <db>-schema-create.sql
	TableSchema = 1,	// <db>.<table>-schema.sql
	TableData = 2,		// <db>.<table>[.<part>].sql
	Ignored = 3
};

const char *ToString(FileCategory category);

// =============================================================================
// English: TableIdentity - names derived from a schema or data file name
// 한글: TableIdentity - 스키마 또는 데이터 파일 이름에서 추출한 이름
// =============================================================================

struct TableIdentity
{
	std::string mDatabase;
	std::string mTable;
	std::string mPart; // English: empty = unsharded / 한글: 비어 있으면 샤드 없음

	// English: Part as it appears in logs ("0" for an unsharded file)
	// 한글: 로그에 표시되는 파트 ("0" = 샤드 없는 파일)
	std::string GetPartLabel() const { return mPart.empty() ? "0" : mPart; }
};

// =============================================================================
// English: DumpFileSet - catalog output, paths in walk order
// 한글: DumpFileSet - 카탈로그 결과, 탐색 순서대로의 경로
// =============================================================================

struct DumpFileSet
{
	std::vector<std::string> mDatabases;
	std::vector<std::string> mSchemas;
	std::vector<std::string> mTables;

	size_t GetTotalCount() const { return mDatabases.size() + mSchemas.size() + mTables.size(); }
};

// =============================================================================
// English: DumpCatalog class
// 한글: DumpCatalog 클래스
// =============================================================================

/**
 * English: Walks a dump directory and sorts regular files by suffix. Each
 *          directory's entries are visited in lexical order and subdirectories
 *          are descended into as they are met, so the output is deterministic.
 *          Any filesystem error throws RestoreException.
 * 한글: 덤프 디렉터리를 탐색하여 일반 파일을 접미사로 분류. 각 디렉터리의
 *       항목은 사전순으로 방문하며 하위 디렉터리는 만나는 즉시 내려가므로
 *       결과가 결정적임. 파일 시스템 오류는 RestoreException 발생.
 */
class DumpCatalog
{
  public:
	static constexpr const char *kDatabaseSchemaSuffix = "-schema-create.sql";
	static constexpr const char *kTableSchemaSuffix = "-schema.sql";
	static constexpr const char *kTableDataSuffix = ".sql";

	static DumpFileSet Load(const std::string &rootDir);

	// English: Classify by the file name only; the most specific suffix wins
	// 한글: 파일 이름만으로 분류; 가장 구체적인 접미사가 우선
	static FileCategory Classify(const std::string &path);

	// English: "<dir>/shop-schema-create.sql" -> "shop"
	// 한글: "<dir>/shop-schema-create.sql" -> "shop"
	static std::string ParseDatabaseName(const std::string &path);

	// English: "<dir>/shop.orders-schema.sql" -> {shop, orders}. The table part may be
	//          empty for a malformed name; callers only need the database.
	// 한글: "<dir>/shop.orders-schema.sql" -> {shop, orders}. 잘못된 이름이면 테이블이
	//       비어 있을 수 있음; 호출자는 데이터베이스만 필요.
	static TableIdentity ParseTableSchemaIdentity(const std::string &path);

	// English: "<dir>/shop.orders.3.sql" -> {shop, orders, 3}.
	//          Throws RestoreException when fewer than two segments remain.
	// 한글: "<dir>/shop.orders.3.sql" -> {shop, orders, 3}.
	//       세그먼트가 두 개 미만이면 RestoreException 발생.
	static TableIdentity ParseTableIdentity(const std::string &path);

  private:
	static void Walk(const std::string &dir, DumpFileSet &files);
	static std::string BaseName(const std::string &path);
};

} // namespace Restore
} // namespace DumpLoader
