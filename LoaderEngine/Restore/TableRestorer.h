#pragma once

// English: Replays one table (or table shard) data file on one connection
// 한글: 하나의 연결에서 테이블 (또는 테이블 샤드) 데이터 파일 하나를 재생

#include "Interfaces/IConnection.h"
#include <cstdint>
#include <string>

namespace DumpLoader
{
namespace Restore
{

class TableRestorer
{
  public:
	// English: Returns the byte length of the file text (the throughput unit).
	//          Throws RestoreException on the first failing statement.
	// 한글: 파일 텍스트의 바이트 길이 반환 (처리량 단위).
	//       첫 번째로 실패한 구문에서 RestoreException 발생.
	static uint64_t RestoreTable(Database::IConnection &connection, const std::string &tablePath);
};

} // namespace Restore
} // namespace DumpLoader
