#pragma once

// English: ODBC implementation of database interfaces
// 한글: 데이터베이스 인터페이스의 ODBC 구현

#include "../Interfaces/DatabaseConfig.h"
#include "../Interfaces/DatabaseException.h"
#include "../Interfaces/IConnection.h"
#include "../Interfaces/IDatabase.h"
#include "../Interfaces/IStatement.h"

#include <atomic>
#include <memory>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
// 한글: ODBC 헤더가 필요로 하는 Windows 타입을 먼저 정의한다.
#include <windows.h>
#endif
#include <sql.h>
#include <sqlext.h>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: ODBCDatabase class
// 한글: ODBCDatabase 클래스
// =============================================================================

/**
 * English: ODBC implementation of IDatabase. Owns the environment handle;
 *          every connection it creates gets a sequential id starting at 1.
 * 한글: IDatabase의 ODBC 구현. 환경 핸들을 소유하며,
 *       생성하는 모든 연결에 1부터 시작하는 순차 ID를 부여.
 */
class ODBCDatabase : public IDatabase
{
  public:
	ODBCDatabase();
	virtual ~ODBCDatabase();

	ODBCDatabase(const ODBCDatabase &) = delete;
	ODBCDatabase &operator=(const ODBCDatabase &) = delete;

	// English: IDatabase interface
	// 한글: IDatabase 인터페이스
	void Connect(const DatabaseConfig &config) override;
	void Disconnect() override;
	bool IsConnected() const override;

	std::unique_ptr<IConnection> CreateConnection() override;

	DatabaseType GetType() const override { return DatabaseType::ODBC; }

	const DatabaseConfig &GetConfig() const override { return mConfig; }

  private:
	void InitializeEnvironment();
	void CleanupEnvironment();

  private:
	DatabaseConfig mConfig;
	SQLHENV mEnvironment;
	bool mConnected;
	std::atomic<uint32_t> mNextConnectionId;
};

// =============================================================================
// English: ODBCConnection class
// 한글: ODBCConnection 클래스
// =============================================================================

class ODBCConnection : public IConnection
{
  public:
	ODBCConnection(SQLHENV env, uint32_t id, int loginTimeoutSeconds, int commandTimeoutSeconds);
	virtual ~ODBCConnection();

	ODBCConnection(const ODBCConnection &) = delete;
	ODBCConnection &operator=(const ODBCConnection &) = delete;

	// English: IConnection interface
	// 한글: IConnection 인터페이스
	void Open(const std::string &connectionString) override;
	void Close() override;
	bool IsOpen() const override;

	uint32_t GetId() const override { return mId; }

	std::unique_ptr<IStatement> CreateStatement() override;

  private:
	void CheckSQLReturn(SQLRETURN ret, const std::string &operation);

  private:
	SQLHDBC mConnection;
	SQLHENV mEnvironment;
	uint32_t mId;
	int mCommandTimeout;
	bool mConnected;
};

// =============================================================================
// English: ODBCStatement class
// 한글: ODBCStatement 클래스
// =============================================================================

/**
 * English: SQLExecDirect wrapper. Execute() drains every result of a
 *          multi-statement batch so an error in a later statement is not lost.
 * 한글: SQLExecDirect 래퍼. Execute()는 다중 구문 배치의 모든 결과를 소비하여
 *       뒤쪽 구문의 오류가 유실되지 않도록 함.
 */
class ODBCStatement : public IStatement
{
  public:
	explicit ODBCStatement(SQLHDBC conn);
	virtual ~ODBCStatement();

	ODBCStatement(const ODBCStatement &) = delete;
	ODBCStatement &operator=(const ODBCStatement &) = delete;

	// English: IStatement interface
	// 한글: IStatement 인터페이스
	void SetQuery(const std::string &query) override;
	void SetTimeout(int seconds) override;

	bool Execute() override;

	void Close() override;

  private:
	SQLRETURN ExecDirect();
	void DrainResults();
	void CheckSQLReturn(SQLRETURN ret, const std::string &operation);

  private:
	SQLHSTMT mStatement;
	SQLHDBC mConnection;
	std::string mQuery;
	int mTimeout;
};

// English: Builds "<operation> failed: [SQLSTATE] message" from the first diagnostic
//          record of a handle, keeping the native error and SQLSTATE
// 한글: 핸들의 첫 번째 진단 레코드로 "<operation> failed: [SQLSTATE] message" 생성,
//       네이티브 오류와 SQLSTATE 보존
DatabaseException MakeODBCException(SQLHANDLE handle, SQLSMALLINT handleType, const std::string &operation);

// English: Statement length for SQLExecDirect; throws when it does not fit SQLINTEGER
// 한글: SQLExecDirect용 구문 길이; SQLINTEGER에 맞지 않으면 예외
SQLINTEGER ToStatementLength(size_t size);

} // namespace Database
} // namespace DumpLoader
