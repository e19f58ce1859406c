#pragma once

// English: In-memory mock database for tests and dry runs (no external dependencies)
// 한글: 테스트 및 dry run용 인메모리 Mock 데이터베이스 (외부 의존성 없음)

#include "../Interfaces/DatabaseConfig.h"
#include "../Interfaces/DatabaseException.h"
#include "../Interfaces/IConnection.h"
#include "../Interfaces/IDatabase.h"
#include "../Interfaces/IStatement.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: ExecutedQuery - record of a query execution (for test verification)
// 한글: ExecutedQuery - 쿼리 실행 기록 (테스트 검증용)
// =============================================================================

struct ExecutedQuery
{
	std::string query;
	uint32_t connectionId = 0;

	// English: Global execution order across all connections, starting at 1
	// 한글: 모든 연결에 걸친 전역 실행 순서, 1부터 시작
	uint64_t sequence = 0;
};

// English: Called before a query is recorded; throwing DatabaseException fails the query
// 한글: 쿼리 기록 전에 호출; DatabaseException을 던지면 쿼리 실패
using ExecuteHook = std::function<void(const ExecutedQuery &)>;

// =============================================================================
// English: MockState - log shared by the database and every connection it created
// 한글: MockState - 데이터베이스와 생성된 모든 연결이 공유하는 로그
// =============================================================================

struct MockState
{
	std::mutex mutex;
	std::vector<ExecutedQuery> log;
	uint64_t nextSequence = 1;
	ExecuteHook hook;
};

// =============================================================================
// English: MockStatement - logs every query, returns success unless the hook throws
// 한글: MockStatement - 모든 쿼리를 기록, 훅이 예외를 던지지 않으면 성공 반환
// =============================================================================

class MockStatement : public IStatement
{
  public:
	MockStatement(std::shared_ptr<MockState> state, uint32_t connectionId)
		: mState(std::move(state)), mConnectionId(connectionId), mTimeout(0)
	{
	}
	virtual ~MockStatement() = default;

	void SetQuery(const std::string &query) override { mQuery = query; }
	void SetTimeout(int seconds) override { mTimeout = seconds; }

	bool Execute() override
	{
		RecordExecution();
		return true;
	}

	void Close() override {}

  private:
	void RecordExecution();

  private:
	std::shared_ptr<MockState> mState;
	uint32_t mConnectionId;
	std::string mQuery;
	int mTimeout;
};

// =============================================================================
// English: MockConnection - tracks open state, creates MockStatements
// 한글: MockConnection - 연결 상태 추적, MockStatement 생성
// =============================================================================

class MockConnection : public IConnection
{
  public:
	MockConnection(std::shared_ptr<MockState> state, uint32_t id)
		: mState(std::move(state)), mId(id), mConnected(false)
	{
	}
	virtual ~MockConnection() = default;

	void Open([[maybe_unused]] const std::string &connectionString) override { mConnected = true; }
	void Close() override { mConnected = false; }
	bool IsOpen() const override { return mConnected; }

	uint32_t GetId() const override { return mId; }

	std::unique_ptr<IStatement> CreateStatement() override
	{
		if (!mConnected)
		{
			throw DatabaseException("Mock connection " + std::to_string(mId) + " not open");
		}
		return std::make_unique<MockStatement>(mState, mId);
	}

  private:
	std::shared_ptr<MockState> mState;
	uint32_t mId;
	bool mConnected;
};

// =============================================================================
// English: MockDatabase - in-memory mock, shared query log for all connections
// 한글: MockDatabase - 인메모리 Mock, 모든 커넥션이 쿼리 로그 공유
// =============================================================================

class MockDatabase : public IDatabase
{
  public:
	MockDatabase();
	virtual ~MockDatabase() = default;

	void Connect(const DatabaseConfig &config) override;
	void Disconnect() override;
	bool IsConnected() const override;

	std::unique_ptr<IConnection> CreateConnection() override;

	DatabaseType GetType() const override { return DatabaseType::Mock; }
	const DatabaseConfig &GetConfig() const override { return mConfig; }

	// English: Install a hook run on every execution (latency, injected failures)
	// 한글: 모든 실행마다 호출되는 훅 설치 (지연, 실패 주입)
	void SetExecuteHook(ExecuteHook hook);

	// English: CreateConnection() fails once this many connections exist (0 = unlimited)
	// 한글: 이 수만큼 연결이 생성되면 CreateConnection() 실패 (0 = 무제한)
	void SetConnectionLimit(uint32_t limit) { mConnectionLimit = limit; }

	// English: Test verification - retrieve all logged query executions in sequence order
	// 한글: 테스트 검증용 - 실행된 모든 쿼리 로그를 순서대로 조회
	std::vector<ExecutedQuery> GetExecutedQueries() const;

	uint32_t GetCreatedConnections() const { return mNextConnectionId.load() - 1; }

  private:
	DatabaseConfig mConfig;
	bool mConnected;
	std::shared_ptr<MockState> mState;
	std::atomic<uint32_t> mNextConnectionId;
	uint32_t mConnectionLimit;
};

} // namespace Database
} // namespace DumpLoader
