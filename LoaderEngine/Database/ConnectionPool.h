#pragma once

// English: Fixed-size connection pool implementation
// 한글: 고정 크기 연결 풀 구현

#include "../Interfaces/DatabaseConfig.h"
#include "../Interfaces/DatabaseException.h"
#include "../Interfaces/IConnectionPool.h"
#include "../Interfaces/IDatabase.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace DumpLoader
{
namespace Database
{

// =============================================================================
// English: ConnectionPool class
// 한글: ConnectionPool 클래스
// =============================================================================

/**
 * English: Fixed-size pool. Initialize() opens every connection up front, so a bad
 *          server address or credential fails before any restore work starts.
 *          GetConnection() blocks until a connection is free (no timeout by default).
 * 한글: 고정 크기 풀. Initialize()가 모든 연결을 미리 열기 때문에 잘못된 서버 주소나
 *       인증 정보는 복원 작업 시작 전에 실패함.
 *       GetConnection()은 연결이 반환될 때까지 블록 (기본적으로 타임아웃 없음).
 */
class ConnectionPool : public IConnectionPool
{
  public:
	ConnectionPool();
	virtual ~ConnectionPool();

	ConnectionPool(const ConnectionPool &) = delete;
	ConnectionPool &operator=(const ConnectionPool &) = delete;

	// English: Initialization - backend chosen by config.mType through DatabaseFactory
	// 한글: 초기화 - config.mType에 따라 DatabaseFactory로 백엔드 선택
	bool Initialize(const DatabaseConfig &config);

	// English: Initialization with an injected backend (tests keep a raw pointer to it)
	// 한글: 주입된 백엔드로 초기화 (테스트는 원시 포인터를 보관)
	bool Initialize(const DatabaseConfig &config, std::unique_ptr<IDatabase> database);

	void Shutdown();

	// English: IConnectionPool interface
	// 한글: IConnectionPool 인터페이스
	std::shared_ptr<IConnection> GetConnection() override;
	void ReturnConnection(std::shared_ptr<IConnection> pConnection) override;
	size_t GetActiveConnections() const override;
	size_t GetAvailableConnections() const override;
	size_t GetPoolSize() const override { return mPoolSize; }

	// English: Acquire timeout (<= 0 waits forever)
	// 한글: 획득 타임아웃 (<= 0 이면 무한 대기)
	void SetAcquireTimeout(int seconds);

	// English: Status
	// 한글: 상태
	bool IsInitialized() const { return mInitialized.load(); }

	size_t GetTotalConnections() const;

	// English: Highest number of simultaneously checked-out connections so far
	// 한글: 지금까지 동시에 대여된 연결 수의 최댓값
	size_t GetPeakActiveConnections() const { return mPeakActiveConnections.load(); }

  private:
	// English: Pooled connection structure
	// 한글: 풀링된 연결 구조체
	struct PooledConnection
	{
		std::shared_ptr<IConnection> mConnection;
		std::chrono::steady_clock::time_point mLastUsed;
		bool mInUse;

		explicit PooledConnection(std::shared_ptr<IConnection> pConn)
			: mConnection(std::move(pConn)),
			  mLastUsed(std::chrono::steady_clock::now()), mInUse(false)
		{
		}
	};

	// English: ClearLocked - Close idle connections WITHOUT acquiring mMutex.
	//          Callers (Initialize on failure, Shutdown) must already hold mMutex.
	// 한글: ClearLocked - mMutex 획득 없이 유휴 연결 닫기.
	//       호출자(실패한 Initialize, Shutdown)가 이미 mMutex를 보유해야 함.
	void ClearLocked();

	bool HasFreeConnectionLocked() const;

  private:
	DatabaseConfig mConfig;
	std::unique_ptr<IDatabase> mDatabase;
	std::vector<PooledConnection> mConnections;
	mutable std::mutex mMutex;
	std::condition_variable mCondition;
	std::atomic<bool> mInitialized;
	std::atomic<size_t> mActiveConnections;
	std::atomic<size_t> mPeakActiveConnections;

	size_t mPoolSize;
	std::chrono::seconds mAcquireTimeout;
};

// =============================================================================
// English: ScopedConnection class
// 한글: ScopedConnection 클래스
// =============================================================================

/**
 * English: RAII wrapper for automatic connection return to pool
 * 한글: 풀에 자동으로 연결을 반환하는 RAII 래퍼
 */
class ScopedConnection
{
  public:
	ScopedConnection(std::shared_ptr<IConnection> pConn, IConnectionPool *pPool)
		: mConnection(std::move(pConn)), mPool(pPool)
	{
	}

	~ScopedConnection()
	{
		if (mConnection && mPool)
		{
			mPool->ReturnConnection(mConnection);
		}
	}

	// English: Prevent copy
	// 한글: 복사 방지
	ScopedConnection(const ScopedConnection &) = delete;
	ScopedConnection &operator=(const ScopedConnection &) = delete;

	// English: Allow move
	// 한글: 이동 허용
	ScopedConnection(ScopedConnection &&other) noexcept
		: mConnection(std::move(other.mConnection)), mPool(other.mPool)
	{
		other.mPool = nullptr;
	}

	// English: Access operators
	// 한글: 접근 연산자
	IConnection *operator->() { return mConnection.get(); }

	IConnection &operator*() { return *mConnection; }

	const IConnection *operator->() const { return mConnection.get(); }

	const IConnection &operator*() const { return *mConnection; }

	// English: Validation
	// 한글: 유효성 검사
	bool IsValid() const
	{
		return mConnection != nullptr && mConnection->IsOpen();
	}

	IConnection *Get() { return mConnection.get(); }

	const IConnection *Get() const { return mConnection.get(); }

  private:
	std::shared_ptr<IConnection> mConnection;
	IConnectionPool *mPool;
};

} // namespace Database
} // namespace DumpLoader
