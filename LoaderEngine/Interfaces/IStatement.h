#pragma once

// English: Abstract statement interface
// 한글: 추상 구문 인터페이스

#include <string>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: IStatement interface
// 한글: IStatement 인터페이스
// =============================================================================

/**
 * English: One SQL text (one or more statements) executed against a connection.
 *          Execute() throws DatabaseException on any driver or server error.
 * 한글: 연결에 대해 실행되는 하나의 SQL 텍스트 (하나 이상의 구문).
 *       Execute()는 드라이버 또는 서버 오류 시 DatabaseException 발생.
 */
class IStatement
{
  public:
	virtual ~IStatement() = default;

	// English: Query configuration
	// 한글: 쿼리 설정
	virtual void SetQuery(const std::string &query) = 0;
	virtual void SetTimeout(int seconds) = 0;

	// English: Runs every statement of the text; false when the first one touched no rows
	// 한글: 텍스트의 모든 구문 실행; 첫 구문이 영향을 준 행이 없으면 false
	virtual bool Execute() = 0;

	// English: Cleanup
	// 한글: 정리
	virtual void Close() = 0;
};

} // namespace Database
} // namespace DumpLoader
