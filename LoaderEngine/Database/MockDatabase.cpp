// English: MockDatabase implementation
// 한글: MockDatabase 구현

#include "MockDatabase.h"

namespace DumpLoader
{
namespace Database
{

void MockStatement::RecordExecution()
{
	ExecutedQuery entry;
	entry.query = mQuery;
	entry.connectionId = mConnectionId;

	ExecuteHook hook;
	{
		std::lock_guard<std::mutex> lock(mState->mutex);
		hook = mState->hook;
	}

	// English: Hook runs outside the lock so it may sleep without serializing connections
	// 한글: 훅은 락 밖에서 실행되므로 연결들을 직렬화하지 않고 sleep 가능
	if (hook)
	{
		hook(entry);
	}

	std::lock_guard<std::mutex> lock(mState->mutex);
	entry.sequence = mState->nextSequence++;
	mState->log.push_back(std::move(entry));
}

MockDatabase::MockDatabase()
	: mConnected(false), mState(std::make_shared<MockState>()), mNextConnectionId(1),
	  mConnectionLimit(0)
{
}

void MockDatabase::Connect(const DatabaseConfig &config)
{
	mConfig = config;
	mConnected = true;
}

void MockDatabase::Disconnect()
{
	mConnected = false;
}

bool MockDatabase::IsConnected() const
{
	return mConnected;
}

std::unique_ptr<IConnection> MockDatabase::CreateConnection()
{
	if (!mConnected)
	{
		throw DatabaseException("MockDatabase not connected");
	}
	if (mConnectionLimit != 0 && mNextConnectionId.load() > mConnectionLimit)
	{
		throw DatabaseException("MockDatabase: too many connections", 1040);
	}

	auto conn = std::make_unique<MockConnection>(mState, mNextConnectionId.fetch_add(1));
	conn->Open("");
	return conn;
}

void MockDatabase::SetExecuteHook(ExecuteHook hook)
{
	std::lock_guard<std::mutex> lock(mState->mutex);
	mState->hook = std::move(hook);
}

std::vector<ExecutedQuery> MockDatabase::GetExecutedQueries() const
{
	std::lock_guard<std::mutex> lock(mState->mutex);
	return mState->log;
}

} // namespace Database
} // namespace DumpLoader
