// English: ConnectionPool test suite on the Mock backend (acquire, release, blocking, RAII).
//          No GTest dependency - uses std::cout.
// 한글: Mock 백엔드 기반 ConnectionPool 테스트 (획득, 반환, 블로킹, RAII).
//       GTest 미사용, std::cout 기반.

#include "Database/ConnectionPool.h"
#include "Database/DatabaseFactory.h"
#include "Database/MockDatabase.h"
#include "Interfaces/IStatement.h"
#include "Utils/Logger.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using namespace DumpLoader::Database;

static int gPassed = 0, gFailed = 0;

static void Pass(const char *name)
{
    std::cout << "[PASS] " << name << "\n";
    ++gPassed;
}

static void Fail(const char *name, const std::string &reason)
{
    std::cout << "[FAIL] " << name << " - " << reason << "\n";
    ++gFailed;
}

static DatabaseConfig MockConfig(int poolSize)
{
    DatabaseConfig config;
    config.mType = DatabaseType::Mock;
    config.mPoolSize = poolSize;
    return config;
}

// -----------------------------------------------------------------------
void TestInitializeOpensAllConnections()
{
    const char *name = "InitializeOpensAllConnections";
    auto database = std::make_unique<MockDatabase>();
    MockDatabase *mock = database.get();

    ConnectionPool pool;
    if (!pool.Initialize(MockConfig(3), std::move(database)))
    {
        Fail(name, "Initialize failed");
        return;
    }

    if (mock->GetCreatedConnections() != 3)
        Fail(name, "expected 3 connections opened up front");
    else if (pool.GetTotalConnections() != 3 || pool.GetAvailableConnections() != 3)
        Fail(name, "wrong pool counts");
    else if (pool.GetPoolSize() != 3 || pool.GetActiveConnections() != 0)
        Fail(name, "wrong size/active");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestFactoryBackend()
{
    const char *name = "FactoryBackend";
    ConnectionPool pool;
    if (!pool.Initialize(MockConfig(2)))
    {
        Fail(name, "Initialize through DatabaseFactory failed");
        return;
    }
    auto conn = pool.GetConnection();
    auto statement = conn->CreateStatement();
    statement->SetQuery("SELECT 1");
    if (!statement->Execute())
        Fail(name, "mock statement must succeed");
    else
        Pass(name);
    pool.ReturnConnection(conn);
}

// -----------------------------------------------------------------------
void TestInitializeFailure()
{
    const char *name = "InitializeFailure";
    auto database = std::make_unique<MockDatabase>();
    database->SetConnectionLimit(2);

    ConnectionPool pool;
    ConnectionPool emptyPool;
    if (pool.Initialize(MockConfig(4), std::move(database)))
        Fail(name, "Initialize must fail when a connection cannot be opened");
    else if (pool.IsInitialized())
        Fail(name, "pool must stay uninitialized");
    else if (emptyPool.Initialize(MockConfig(0), std::make_unique<MockDatabase>()))
        Fail(name, "pool size 0 must be rejected");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestAcquireRelease()
{
    const char *name = "AcquireRelease";
    ConnectionPool pool;
    pool.Initialize(MockConfig(3), std::make_unique<MockDatabase>());

    auto a = pool.GetConnection();
    auto b = pool.GetConnection();
    std::set<uint32_t> ids{a->GetId(), b->GetId()};

    if (ids.size() != 2 || pool.GetActiveConnections() != 2 || pool.GetAvailableConnections() != 1)
    {
        Fail(name, "two distinct connections expected");
        return;
    }

    pool.ReturnConnection(a);
    pool.ReturnConnection(b);
    // English: A second return is ignored (warned), counts stay consistent
    // 한글: 두 번째 반환은 무시 (경고), 카운트는 일관 유지
    pool.ReturnConnection(b);

    if (pool.GetActiveConnections() != 0 || pool.GetAvailableConnections() != 3)
        Fail(name, "counts wrong after release");
    else if (pool.GetPeakActiveConnections() != 2)
        Fail(name, "peak must be 2");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestBlocksWhenExhausted()
{
    const char *name = "BlocksWhenExhausted";
    ConnectionPool pool;
    pool.Initialize(MockConfig(1), std::make_unique<MockDatabase>());

    auto held = pool.GetConnection();
    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        auto conn = pool.GetConnection();
        acquired = true;
        pool.ReturnConnection(conn);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    const bool acquiredEarly = acquired.load();

    pool.ReturnConnection(held);
    waiter.join();

    if (acquiredEarly)
        Fail(name, "GetConnection must block while the pool is exhausted");
    else if (!acquired.load())
        Fail(name, "waiter must acquire after the return");
    else if (pool.GetPeakActiveConnections() != 1)
        Fail(name, "never more than one connection out");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestScopedConnectionReleases()
{
    const char *name = "ScopedConnectionReleases";
    ConnectionPool pool;
    pool.Initialize(MockConfig(2), std::make_unique<MockDatabase>());

    {
        ScopedConnection conn(pool.GetConnection(), &pool);
        ScopedConnection moved(std::move(conn));
        if (!moved.IsValid() || pool.GetActiveConnections() != 1)
        {
            Fail(name, "scoped connection not valid");
            return;
        }
    }
    const size_t afterScope = pool.GetActiveConnections();

    try
    {
        ScopedConnection conn(pool.GetConnection(), &pool);
        throw std::runtime_error("unit of work failed");
    }
    catch (const std::runtime_error &)
    {
    }

    if (afterScope != 0)
        Fail(name, "moved-from wrapper must not double return; scope exit must return");
    else if (pool.GetActiveConnections() != 0 || pool.GetAvailableConnections() != 2)
        Fail(name, "connection must be returned when an exception unwinds");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestAcquireTimeout()
{
    const char *name = "AcquireTimeout";
    ConnectionPool pool;
    pool.Initialize(MockConfig(1), std::make_unique<MockDatabase>());
    pool.SetAcquireTimeout(1);

    auto held = pool.GetConnection();
    try
    {
        pool.GetConnection();
        Fail(name, "expected DatabaseException on timeout");
    }
    catch (const DatabaseException &)
    {
        Pass(name);
    }
    pool.ReturnConnection(held);
}

// -----------------------------------------------------------------------
void TestShutdownWakesWaiter()
{
    const char *name = "ShutdownWakesWaiter";
    ConnectionPool pool;
    pool.Initialize(MockConfig(1), std::make_unique<MockDatabase>());

    auto held = pool.GetConnection();
    std::atomic<bool> threw{false};
    std::thread waiter([&]() {
        try
        {
            pool.GetConnection();
        }
        catch (const DatabaseException &)
        {
            threw = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pool.Shutdown();
    waiter.join();

    if (!threw.load())
        Fail(name, "blocked GetConnection must throw on shutdown");
    else if (pool.IsInitialized())
        Fail(name, "pool still initialized");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestMockRecordsSequence()
{
    const char *name = "MockRecordsSequence";
    auto database = std::make_unique<MockDatabase>();
    MockDatabase *mock = database.get();
    ConnectionPool pool;
    pool.Initialize(MockConfig(2), std::move(database));

    mock->SetExecuteHook([](const ExecutedQuery &query) {
        if (query.query == "BAD")
            throw DatabaseException("syntax error", 1064, "42000");
    });

    auto a = pool.GetConnection();
    auto b = pool.GetConnection();
    for (const char *sql : {"A1", "B1", "BAD", "A2"})
    {
        auto &conn = (sql[0] == 'B') ? b : a;
        auto statement = conn->CreateStatement();
        statement->SetQuery(sql);
        try
        {
            statement->Execute();
        }
        catch (const DatabaseException &e)
        {
            if (e.GetNativeError() != 1064 || e.GetSqlState() != "42000")
                Fail(name, "native error code or sqlstate lost");
        }
    }

    const auto log = mock->GetExecutedQueries();
    if (log.size() != 3)
        Fail(name, "failed query must not be recorded");
    else if (log[0].query != "A1" || log[1].query != "B1" || log[2].query != "A2")
        Fail(name, "log order");
    else if (log[0].sequence != 1 || log[2].sequence != 3)
        Fail(name, "sequence numbers");
    else if (log[0].connectionId != a->GetId() || log[1].connectionId != b->GetId())
        Fail(name, "connection ids");
    else
        Pass(name);

    pool.ReturnConnection(a);
    pool.ReturnConnection(b);
}

// -----------------------------------------------------------------------
int main()
{
    DumpLoader::Utils::Logger::SetLevel(DumpLoader::Utils::LogLevel::Err);

    std::cout << "=== ConnectionPool Tests ===\n";
    TestInitializeOpensAllConnections();
    TestFactoryBackend();
    TestInitializeFailure();
    TestAcquireRelease();
    TestBlocksWhenExhausted();
    TestScopedConnectionReleases();
    TestAcquireTimeout();
    TestShutdownWakesWaiter();
    TestMockRecordsSequence();

    std::cout << "\nResult: " << gPassed << " passed, " << gFailed << " failed\n";
    return gFailed > 0 ? 1 : 0;
}
