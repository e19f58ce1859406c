#pragma once

// English: Exception class for restore failures (precondition + execution)
// 한글: 복원 실패용 예외 클래스 (사전 조건 + 실행)

#include <cstdint>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

namespace DumpLoader
{
namespace Restore
{

// =============================================================================
// English: RestoreException - a fatal restore error with dump-file context
// 한글: RestoreException - 덤프 파일 컨텍스트를 포함한 치명적 복원 오류
// =============================================================================

/**
 * English: Every restore failure is fatal. The exception keeps the file, database,
 *          table, part and connection identity so the operator can locate the
 *          offending dump file from the final log line.
 * 한글: 모든 복원 실패는 치명적. 운영자가 마지막 로그 한 줄로 문제 덤프 파일을
 *       찾을 수 있도록 파일, 데이터베이스, 테이블, 파트, 연결 ID를 보관.
 */
class RestoreException : public std::exception
{
  public:
	struct Context
	{
		std::string mFile;
		std::string mDatabase;
		std::string mTable;
		std::string mPart;
		uint32_t mConnectionId = 0; // English: 0 = no connection involved / 한글: 0 = 연결 없음
	};

	explicit RestoreException(const std::string &reason) : RestoreException(reason, Context()) {}

	RestoreException(const std::string &reason, Context context)
		: mReason(reason), mContext(std::move(context))
	{
		mMessage = BuildMessage();
	}

	const char *what() const noexcept override { return mMessage.c_str(); }

	const std::string &GetReason() const { return mReason; }
	const Context &GetContext() const { return mContext; }

  private:
	std::string BuildMessage() const
	{
		std::ostringstream oss;
		oss << "restore.failed";
		if (!mContext.mDatabase.empty())
		{
			oss << ".database[" << mContext.mDatabase << "]";
		}
		if (!mContext.mTable.empty())
		{
			oss << ".table[" << mContext.mTable << "]";
		}
		if (!mContext.mPart.empty())
		{
			oss << ".part[" << mContext.mPart << "]";
		}
		if (mContext.mConnectionId != 0)
		{
			oss << ".conn[" << mContext.mConnectionId << "]";
		}
		if (!mContext.mFile.empty())
		{
			oss << ".file[" << mContext.mFile << "]";
		}
		oss << ": " << mReason;
		return oss.str();
	}

  private:
	std::string mReason;
	Context mContext;
	std::string mMessage;
};

} // namespace Restore
} // namespace DumpLoader
