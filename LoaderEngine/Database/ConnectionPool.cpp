// English: ConnectionPool implementation
// 한글: ConnectionPool 구현

#include "ConnectionPool.h"
#include "DatabaseFactory.h"
#include "Utils/Logger.h"
#include <algorithm>

namespace DumpLoader
{
namespace Database
{

using Utils::Logger;

ConnectionPool::ConnectionPool()
	: mInitialized(false), mActiveConnections(0), mPeakActiveConnections(0),
	  mPoolSize(0), mAcquireTimeout(std::chrono::seconds(0))
{
}

ConnectionPool::~ConnectionPool()
{
	Shutdown();
}

bool ConnectionPool::Initialize(const DatabaseConfig &config)
{
	std::unique_ptr<IDatabase> database;
	try
	{
		database = DatabaseFactory::CreateDatabase(config.mType);
	}
	catch (const DatabaseException &e)
	{
		Logger::Error(std::string("ConnectionPool: cannot create backend: ") + e.what());
		return false;
	}
	return Initialize(config, std::move(database));
}

bool ConnectionPool::Initialize(const DatabaseConfig &config, std::unique_ptr<IDatabase> database)
{
	std::lock_guard<std::mutex> lock(mMutex);

	if (mInitialized.load())
	{
		Logger::Warn("ConnectionPool: already initialized");
		return true;
	}

	if (!database)
	{
		Logger::Error("ConnectionPool: no database backend");
		return false;
	}

	if (config.mPoolSize <= 0)
	{
		Logger::Error("ConnectionPool: pool size must be positive, got " +
					  std::to_string(config.mPoolSize));
		return false;
	}

	mConfig = config;
	mPoolSize = static_cast<size_t>(config.mPoolSize);
	mDatabase = std::move(database);

	try
	{
		mDatabase->Connect(mConfig);

		// English: Open every connection now; the pool never grows or shrinks later
		// 한글: 모든 연결을 지금 열어 둠; 이후 풀은 늘거나 줄지 않음
		mConnections.reserve(mPoolSize);
		for (size_t i = 0; i < mPoolSize; ++i)
		{
			std::shared_ptr<IConnection> conn(mDatabase->CreateConnection());
			mConnections.emplace_back(std::move(conn));
		}
	}
	catch (const DatabaseException &e)
	{
		Logger::Error("ConnectionPool: failed to open " + std::to_string(mPoolSize) +
					  " connections: " + e.what());
		ClearLocked();
		mDatabase->Disconnect();
		mDatabase.reset();
		return false;
	}

	mInitialized.store(true);
	Logger::Info("ConnectionPool: " + std::to_string(mPoolSize) + " " +
				 ToString(mDatabase->GetType()) + " connections ready");
	return true;
}

void ConnectionPool::Shutdown()
{
	std::unique_lock<std::mutex> lock(mMutex);

	if (!mInitialized.load())
	{
		return;
	}

	// English: Refuse new acquisitions and wake any blocked GetConnection()
	// 한글: 새 획득을 거부하고 블록된 GetConnection() 깨우기
	mInitialized.store(false);
	mCondition.notify_all();

	if (mActiveConnections.load() != 0)
	{
		Logger::Warn("ConnectionPool: shutdown with " + std::to_string(mActiveConnections.load()) +
					 " connections still checked out");
	}

	ClearLocked();

	if (mDatabase)
	{
		mDatabase->Disconnect();
		mDatabase.reset();
	}

	Logger::Debug("ConnectionPool: shutdown complete");
}

bool ConnectionPool::HasFreeConnectionLocked() const
{
	return std::any_of(mConnections.begin(), mConnections.end(),
					   [](const PooledConnection &pooled) { return !pooled.mInUse; });
}

std::shared_ptr<IConnection> ConnectionPool::GetConnection()
{
	std::unique_lock<std::mutex> lock(mMutex);

	if (!mInitialized.load())
	{
		throw DatabaseException("Connection pool not initialized");
	}

	auto ready = [this] { return !mInitialized.load() || HasFreeConnectionLocked(); };

	if (mAcquireTimeout.count() <= 0)
	{
		mCondition.wait(lock, ready);
	}
	else if (!mCondition.wait_for(lock, mAcquireTimeout, ready))
	{
		throw DatabaseException("Connection pool timeout - no connections available");
	}

	if (!mInitialized.load())
	{
		throw DatabaseException("Connection pool shut down while waiting");
	}

	for (auto &pooled : mConnections)
	{
		if (!pooled.mInUse)
		{
			pooled.mInUse = true;
			pooled.mLastUsed = std::chrono::steady_clock::now();

			const size_t active = mActiveConnections.fetch_add(1) + 1;
			size_t peak = mPeakActiveConnections.load();
			while (active > peak && !mPeakActiveConnections.compare_exchange_weak(peak, active))
			{
			}
			return pooled.mConnection;
		}
	}

	throw DatabaseException("No connections available");
}

void ConnectionPool::ReturnConnection(std::shared_ptr<IConnection> pConnection)
{
	if (!pConnection)
	{
		return;
	}

	{
		std::lock_guard<std::mutex> lock(mMutex);

		auto it = std::find_if(mConnections.begin(), mConnections.end(),
							   [&](const PooledConnection &pooled) {
								   return pooled.mConnection == pConnection;
							   });
		if (it == mConnections.end())
		{
			Logger::Warn("ConnectionPool: returned connection " +
						 std::to_string(pConnection->GetId()) + " is not owned by this pool");
			return;
		}
		if (!it->mInUse)
		{
			Logger::Warn("ConnectionPool: connection " + std::to_string(pConnection->GetId()) +
						 " returned twice");
			return;
		}

		it->mInUse = false;
		it->mLastUsed = std::chrono::steady_clock::now();
		mActiveConnections.fetch_sub(1);
	}
	mCondition.notify_one();
}

void ConnectionPool::ClearLocked()
{
	// English: Close all connections that are not in use (caller holds mMutex)
	// 한글: 사용 중이 아닌 모든 연결 닫기 (호출자가 mMutex 보유)
	for (auto it = mConnections.begin(); it != mConnections.end();)
	{
		if (!it->mInUse)
		{
			it->mConnection->Close();
			it = mConnections.erase(it);
		}
		else
		{
			++it;
		}
	}
}

size_t ConnectionPool::GetActiveConnections() const
{
	return mActiveConnections.load();
}

size_t ConnectionPool::GetAvailableConnections() const
{
	std::lock_guard<std::mutex> lock(mMutex);
	return static_cast<size_t>(std::count_if(
		mConnections.begin(), mConnections.end(),
		[](const PooledConnection &pooled) { return !pooled.mInUse; }));
}

void ConnectionPool::SetAcquireTimeout(int seconds)
{
	std::lock_guard<std::mutex> lock(mMutex);
	mAcquireTimeout = std::chrono::seconds(seconds);
}

size_t ConnectionPool::GetTotalConnections() const
{
	std::lock_guard<std::mutex> lock(mMutex);
	return mConnections.size();
}

} // namespace Database
} // namespace DumpLoader
