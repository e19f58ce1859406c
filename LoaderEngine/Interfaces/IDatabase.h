#pragma once

// English: Abstract database interface
// 한글: 추상 데이터베이스 인터페이스

#include "DatabaseConfig.h"
#include "DatabaseType_enum.h"
#include <memory>

namespace DumpLoader
{
namespace Database
{

// English: Forward declarations
// 한글: 전방 선언
class IConnection;

// =============================================================================
// English: IDatabase interface
// 한글: IDatabase 인터페이스
// =============================================================================

/**
 * English: Abstract database interface - a backend that hands out connections
 * 한글: 추상 데이터베이스 인터페이스 - 연결을 생성해 주는 백엔드
 */
class IDatabase
{
  public:
	virtual ~IDatabase() = default;

	// English: Connection management
	// 한글: 연결 관리
	virtual void Connect(const DatabaseConfig &config) = 0;
	virtual void Disconnect() = 0;
	virtual bool IsConnected() const = 0;

	// English: Object creation - returned connection is already open
	// 한글: 객체 생성 - 반환된 연결은 이미 열린 상태
	virtual std::unique_ptr<IConnection> CreateConnection() = 0;

	// English: Information
	// 한글: 정보
	virtual DatabaseType GetType() const = 0;
	virtual const DatabaseConfig &GetConfig() const = 0;
};

} // namespace Database
} // namespace DumpLoader
