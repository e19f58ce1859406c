#pragma once

// English: Abstract connection interface
// 한글: 추상 연결 인터페이스

#include <cstdint>
#include <memory>
#include <string>

namespace DumpLoader
{
namespace Database
{

// English: Forward declaration
// 한글: 전방 선언
class IStatement;

// =============================================================================
// English: IConnection interface
// 한글: IConnection 인터페이스
// =============================================================================

/**
 * English: Abstract connection interface
 * 한글: 추상 연결 인터페이스
 */
class IConnection
{
  public:
	virtual ~IConnection() = default;

	// English: Connection management
	// 한글: 연결 관리
	virtual void Open(const std::string &connectionString) = 0;
	virtual void Close() = 0;
	virtual bool IsOpen() const = 0;

	// English: Identity for logging (unique per IDatabase, starts at 1)
	// 한글: 로깅용 식별자 (IDatabase 내에서 유일, 1부터 시작)
	virtual uint32_t GetId() const = 0;

	// English: Statement creation
	// 한글: 구문 생성
	virtual std::unique_ptr<IStatement> CreateStatement() = 0;
};

} // namespace Database
} // namespace DumpLoader
