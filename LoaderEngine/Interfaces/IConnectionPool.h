#pragma once

// English: Connection pool interface
// 한글: 연결 풀 인터페이스

#include "IConnection.h"
#include <memory>

namespace DumpLoader {
namespace Database {

    // =============================================================================
    // English: IConnectionPool interface
    // 한글: IConnectionPool 인터페이스
    // =============================================================================

    /**
     * English: Connection pool interface
     * 한글: 연결 풀 인터페이스
     */
    class IConnectionPool
    {
    public:
        virtual ~IConnectionPool() = default;

        // English: Get a connection from the pool (blocks while none is free)
        // 한글: 풀에서 연결 가져오기 (사용 가능한 연결이 없으면 블록)
        virtual std::shared_ptr<IConnection> GetConnection() = 0;

        // English: Return a connection to the pool
        // 한글: 풀에 연결 반환하기
        virtual void ReturnConnection(std::shared_ptr<IConnection> pConnection) = 0;

        // English: Get number of checked-out connections
        // 한글: 대여 중인 연결 수 조회
        virtual size_t GetActiveConnections() const = 0;

        // English: Get number of available connections
        // 한글: 사용 가능한 연결 수 조회
        virtual size_t GetAvailableConnections() const = 0;

        // English: Fixed pool size
        // 한글: 고정 풀 크기
        virtual size_t GetPoolSize() const = 0;
    };

}  // namespace Database
}  // namespace DumpLoader
