// English: ODBCDatabase implementation
// 한글: ODBCDatabase 구현

#include "ODBCDatabase.h"
#include "Utils/Logger.h"
#include <cstdint>
#include <limits>
#include <sstream>

namespace DumpLoader
{
namespace Database
{

namespace
{

bool Succeeded(SQLRETURN ret)
{
	return ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO;
}

} // namespace

DatabaseException MakeODBCException(SQLHANDLE handle, SQLSMALLINT handleType, const std::string &operation)
{
	SQLCHAR sqlState[6] = {0};
	SQLCHAR message[SQL_MAX_MESSAGE_LENGTH] = {0};
	SQLINTEGER nativeError = 0;
	SQLSMALLINT messageLength = 0;

	SQLRETURN ret = SQLGetDiagRec(handleType, handle, 1, sqlState, &nativeError, message,
								  SQL_MAX_MESSAGE_LENGTH, &messageLength);
	if (!Succeeded(ret))
	{
		return DatabaseException(operation + " failed: no diagnostic available");
	}

	const std::string state(reinterpret_cast<char *>(sqlState));
	std::ostringstream oss;
	oss << operation << " failed: [" << state << "] " << reinterpret_cast<char *>(message);
	return DatabaseException(oss.str(), static_cast<int>(nativeError), state);
}

SQLINTEGER ToStatementLength(size_t size)
{
	if (size > static_cast<size_t>(std::numeric_limits<SQLINTEGER>::max()))
	{
		throw DatabaseException("statement of " + std::to_string(size) + " bytes exceeds the ODBC limit of " +
								std::to_string(std::numeric_limits<SQLINTEGER>::max()) + " bytes");
	}
	return static_cast<SQLINTEGER>(size);
}

// =============================================================================
// English: ODBCDatabase Implementation
// 한글: ODBCDatabase 구현
// =============================================================================

ODBCDatabase::ODBCDatabase()
	: mEnvironment(SQL_NULL_HANDLE), mConnected(false), mNextConnectionId(1)
{
	InitializeEnvironment();
}

ODBCDatabase::~ODBCDatabase()
{
	Disconnect();
	CleanupEnvironment();
}

void ODBCDatabase::InitializeEnvironment()
{
	SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &mEnvironment);
	if (!Succeeded(ret))
	{
		throw DatabaseException("Failed to allocate ODBC environment handle");
	}

	ret = SQLSetEnvAttr(mEnvironment, SQL_ATTR_ODBC_VERSION,
						reinterpret_cast<SQLPOINTER>(static_cast<intptr_t>(SQL_OV_ODBC3)), 0);
	if (!Succeeded(ret))
	{
		CleanupEnvironment();
		throw DatabaseException("Failed to set ODBC version");
	}
}

void ODBCDatabase::CleanupEnvironment()
{
	if (mEnvironment != SQL_NULL_HANDLE)
	{
		SQLFreeHandle(SQL_HANDLE_ENV, mEnvironment);
		mEnvironment = SQL_NULL_HANDLE;
	}
}

void ODBCDatabase::Connect(const DatabaseConfig &config)
{
	mConfig = config;
	mConnected = true;
	Utils::Logger::Debug("ODBCDatabase: target " + config.mHost + ":" +
						 std::to_string(config.mPort) + " via {" + config.mDriver + "}");
}

void ODBCDatabase::Disconnect()
{
	mConnected = false;
}

bool ODBCDatabase::IsConnected() const
{
	return mConnected;
}

std::unique_ptr<IConnection> ODBCDatabase::CreateConnection()
{
	if (!mConnected)
	{
		throw DatabaseException("Database not connected");
	}

	auto connection = std::make_unique<ODBCConnection>(
		mEnvironment, mNextConnectionId.fetch_add(1), mConfig.mConnectionTimeout,
		mConfig.mCommandTimeout);
	connection->Open(mConfig.GetConnectionString());
	return connection;
}

// =============================================================================
// English: ODBCConnection Implementation
// 한글: ODBCConnection 구현
// =============================================================================

ODBCConnection::ODBCConnection(SQLHENV env, uint32_t id, int loginTimeoutSeconds,
							   int commandTimeoutSeconds)
	: mConnection(SQL_NULL_HANDLE), mEnvironment(env), mId(id),
	  mCommandTimeout(commandTimeoutSeconds), mConnected(false)
{
	SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, mEnvironment, &mConnection);
	if (!Succeeded(ret))
	{
		throw MakeODBCException(mEnvironment, SQL_HANDLE_ENV, "Allocate connection handle");
	}

	if (loginTimeoutSeconds > 0)
	{
		ret = SQLSetConnectAttr(mConnection, SQL_ATTR_LOGIN_TIMEOUT,
								reinterpret_cast<SQLPOINTER>(static_cast<intptr_t>(loginTimeoutSeconds)), 0);
		if (!Succeeded(ret))
		{
			// English: The destructor does not run for a half-built object
			// 한글: 생성이 끝나지 않은 객체는 소멸자가 실행되지 않음
			DatabaseException error = MakeODBCException(mConnection, SQL_HANDLE_DBC, "Set login timeout");
			SQLFreeHandle(SQL_HANDLE_DBC, mConnection);
			mConnection = SQL_NULL_HANDLE;
			throw error;
		}
	}
}

ODBCConnection::~ODBCConnection()
{
	Close();
	if (mConnection != SQL_NULL_HANDLE)
	{
		SQLFreeHandle(SQL_HANDLE_DBC, mConnection);
		mConnection = SQL_NULL_HANDLE;
	}
}

void ODBCConnection::Open(const std::string &connectionString)
{
	if (mConnected)
	{
		return; // Already connected
	}

	SQLCHAR connStrOut[1024];
	SQLSMALLINT connStrOutLength = 0;

	SQLRETURN ret = SQLDriverConnect(
		mConnection, nullptr,
		reinterpret_cast<SQLCHAR *>(const_cast<char *>(connectionString.c_str())), SQL_NTS,
		connStrOut, sizeof(connStrOut), &connStrOutLength, SQL_DRIVER_NOPROMPT);

	CheckSQLReturn(ret, "Connection " + std::to_string(mId));
	mConnected = true;
}

void ODBCConnection::Close()
{
	if (mConnection != SQL_NULL_HANDLE && mConnected)
	{
		SQLDisconnect(mConnection);
		mConnected = false;
	}
}

bool ODBCConnection::IsOpen() const
{
	return mConnected;
}

std::unique_ptr<IStatement> ODBCConnection::CreateStatement()
{
	if (!mConnected)
	{
		throw DatabaseException("Connection " + std::to_string(mId) + " not open");
	}

	auto statement = std::make_unique<ODBCStatement>(mConnection);
	if (mCommandTimeout > 0)
	{
		statement->SetTimeout(mCommandTimeout);
	}
	return statement;
}

void ODBCConnection::CheckSQLReturn(SQLRETURN ret, const std::string &operation)
{
	if (!Succeeded(ret))
	{
		throw MakeODBCException(mConnection, SQL_HANDLE_DBC, operation);
	}
}

// =============================================================================
// English: ODBCStatement Implementation
// 한글: ODBCStatement 구현
// =============================================================================

ODBCStatement::ODBCStatement(SQLHDBC conn)
	: mStatement(SQL_NULL_HANDLE), mConnection(conn), mTimeout(0)
{
	SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, mConnection, &mStatement);
	if (!Succeeded(ret))
	{
		throw MakeODBCException(mConnection, SQL_HANDLE_DBC, "Allocate statement handle");
	}
}

ODBCStatement::~ODBCStatement()
{
	Close();
}

void ODBCStatement::SetQuery(const std::string &query)
{
	mQuery = query;
}

void ODBCStatement::SetTimeout(int seconds)
{
	mTimeout = seconds;
	SQLRETURN ret = SQLSetStmtAttr(mStatement, SQL_ATTR_QUERY_TIMEOUT,
								   reinterpret_cast<SQLPOINTER>(static_cast<intptr_t>(mTimeout)), 0);
	CheckSQLReturn(ret, "Set timeout");
}

SQLRETURN ODBCStatement::ExecDirect()
{
	if (mStatement == SQL_NULL_HANDLE)
	{
		throw DatabaseException("Statement closed");
	}

	// English: SQLExecDirect takes SQLINTEGER length; avoid SQL_NTS so embedded
	//          NUL bytes in dump data do not silently truncate the statement.
	// 한글: SQLExecDirect에 명시적 길이를 전달하여 덤프 데이터에 NUL 바이트가
	//       있어도 구문이 조용히 잘리지 않도록 함.
	const SQLINTEGER length = ToStatementLength(mQuery.size());
	return SQLExecDirect(mStatement, reinterpret_cast<SQLCHAR *>(const_cast<char *>(mQuery.data())), length);
}

void ODBCStatement::DrainResults()
{
	for (;;)
	{
		SQLRETURN ret = SQLMoreResults(mStatement);
		if (ret == SQL_NO_DATA)
		{
			break;
		}
		CheckSQLReturn(ret, "Execute (next result)");
	}
}

bool ODBCStatement::Execute()
{
	SQLRETURN ret = ExecDirect();

	// English: SQL_NO_DATA only says the first statement (a searched UPDATE/DELETE)
	//          matched no rows; the rest of a batch still has to be checked
	// 한글: SQL_NO_DATA는 첫 구문 (조건부 UPDATE/DELETE)이 일치하는 행이 없다는 뜻일 뿐;
	//       배치의 나머지 구문은 여전히 확인해야 함
	const bool touchedRows = ret != SQL_NO_DATA;
	if (touchedRows)
	{
		CheckSQLReturn(ret, "Execute");
	}
	DrainResults();
	return touchedRows;
}

void ODBCStatement::Close()
{
	if (mStatement != SQL_NULL_HANDLE)
	{
		SQLFreeHandle(SQL_HANDLE_STMT, mStatement);
		mStatement = SQL_NULL_HANDLE;
	}
}

void ODBCStatement::CheckSQLReturn(SQLRETURN ret, const std::string &operation)
{
	if (!Succeeded(ret))
	{
		throw MakeODBCException(mStatement, SQL_HANDLE_STMT, operation);
	}
}

} // namespace Database
} // namespace DumpLoader
