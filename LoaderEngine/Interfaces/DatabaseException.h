#pragma once

// English: Driver or server failure raised by the database layer
// 한글: 데이터베이스 계층이 던지는 드라이버/서버 실패

#include <stdexcept>
#include <string>
#include <utility>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: DatabaseException - connect, pool and execute failures
// 한글: DatabaseException - 연결, 풀, 실행 실패
// =============================================================================

/**
 * English: nativeError is the server error number (1064 syntax, 1040 too many
 *          connections, ...); 0 when the failure never reached the server.
 *          sqlState is the five-character ODBC state, empty when unknown.
 * 한글: nativeError는 서버 오류 번호 (1064 문법, 1040 연결 초과, ...);
 *       서버에 도달하지 못한 실패는 0. sqlState는 5자리 ODBC 상태, 모르면 빈 문자열.
 */
class DatabaseException : public std::runtime_error
{
  public:
	explicit DatabaseException(const std::string &message, int nativeError = 0, std::string sqlState = std::string())
		: std::runtime_error(message), mNativeError(nativeError), mSqlState(std::move(sqlState))
	{
	}

	int GetNativeError() const { return mNativeError; }
	const std::string &GetSqlState() const { return mSqlState; }

	// English: "error 1064" or "error 1064, sqlstate 42000"
	// 한글: "error 1064" 또는 "error 1064, sqlstate 42000"
	std::string DescribeCode() const
	{
		std::string text = "error " + std::to_string(mNativeError);
		if (!mSqlState.empty())
		{
			text += ", sqlstate " + mSqlState;
		}
		return text;
	}

  private:
	int mNativeError;
	std::string mSqlState;
};

} // namespace Database
} // namespace DumpLoader
