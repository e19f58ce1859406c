// English: DumpCatalog implementation
// 한글: DumpCatalog 구현

#include "DumpCatalog.h"
#include "Interfaces/RestoreException.h"
#include "Utils/Logger.h"
#include "Utils/StringUtils.h"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace DumpLoader
{
namespace Restore
{

namespace fs = std::filesystem;
using Utils::StringUtils;

const char *ToString(FileCategory category)
{
	switch (category)
	{
	case FileCategory::DatabaseSchema:
		return "database";
	case FileCategory::TableSchema:
		return "schema";
	case FileCategory::TableData:
		return "table";
	case FileCategory::Ignored:
		return "ignored";
	}
	return "unknown";
}

DumpFileSet DumpCatalog::Load(const std::string &rootDir)
{
	std::error_code ec;
	if (!fs::is_directory(rootDir, ec))
	{
		RestoreException::Context context;
		context.mFile = rootDir;
		throw RestoreException(ec ? "cannot access dump directory: " + ec.message()
								  : "dump directory does not exist or is not a directory",
							   context);
	}

	DumpFileSet files;
	Walk(rootDir, files);

	Utils::Logger::Info("loader.files.databases[" + std::to_string(files.mDatabases.size()) +
						"].schemas[" + std::to_string(files.mSchemas.size()) + "].tables[" +
						std::to_string(files.mTables.size()) + "]");
	return files;
}

void DumpCatalog::Walk(const std::string &dir, DumpFileSet &files)
{
	auto fail = [](const std::string &path, const std::error_code &ec) {
		RestoreException::Context context;
		context.mFile = path;
		throw RestoreException("loader.file.walk.error: " + ec.message(), context);
	};

	std::error_code ec;
	fs::directory_iterator it(dir, ec);
	if (ec)
	{
		fail(dir, ec);
	}

	std::vector<fs::path> entries;
	for (fs::directory_iterator end; it != end; it.increment(ec))
	{
		if (ec)
		{
			fail(dir, ec);
		}
		entries.push_back(it->path());
	}
	if (ec)
	{
		fail(dir, ec);
	}

	// English: directory_iterator order is unspecified; visit in lexical order
	// 한글: directory_iterator 순서는 정해져 있지 않으므로 사전순으로 방문
	std::sort(entries.begin(), entries.end(),
			  [](const fs::path &a, const fs::path &b) { return a.filename().string() < b.filename().string(); });

	for (const auto &entry : entries)
	{
		// English: Symlinked directories are not followed
		// 한글: 심볼릭 링크 디렉터리는 따라가지 않음
		const fs::file_status linkStatus = fs::symlink_status(entry, ec);
		if (ec)
		{
			fail(entry.string(), ec);
		}
		if (fs::is_directory(linkStatus))
		{
			Walk(entry.string(), files);
			continue;
		}

		// English: Classify by name first; a non-dump entry is never resolved,
		//          so a dangling symlink such as latest.log does not stop the walk
		// 한글: 이름으로 먼저 분류; 덤프 파일이 아니면 대상을 확인하지 않으므로
		//       latest.log 같은 끊어진 심볼릭 링크가 탐색을 멈추지 않음
		const std::string path = entry.string();
		const FileCategory category = Classify(path);
		if (category == FileCategory::Ignored)
		{
			Utils::Logger::Debug("loader.file.skip[" + path + "]");
			continue;
		}

		const fs::file_status status = fs::is_symlink(linkStatus) ? fs::status(entry, ec) : linkStatus;
		if (ec)
		{
			fail(path, ec);
		}
		if (!fs::is_regular_file(status))
		{
			continue;
		}

		switch (category)
		{
		case FileCategory::DatabaseSchema:
			files.mDatabases.push_back(path);
			break;
		case FileCategory::TableSchema:
			files.mSchemas.push_back(path);
			break;
		case FileCategory::TableData:
			files.mTables.push_back(path);
			break;
		case FileCategory::Ignored:
			break;
		}
	}
}

std::string DumpCatalog::BaseName(const std::string &path)
{
	return fs::path(path).filename().string();
}

FileCategory DumpCatalog::Classify(const std::string &path)
{
	const std::string base = BaseName(path);
	if (StringUtils::EndsWith(base, kDatabaseSchemaSuffix))
	{
		return FileCategory::DatabaseSchema;
	}
	if (StringUtils::EndsWith(base, kTableSchemaSuffix))
	{
		return FileCategory::TableSchema;
	}
	if (StringUtils::EndsWith(base, kTableDataSuffix))
	{
		return FileCategory::TableData;
	}
	return FileCategory::Ignored;
}

std::string DumpCatalog::ParseDatabaseName(const std::string &path)
{
	return StringUtils::RemoveSuffix(BaseName(path), kDatabaseSchemaSuffix);
}

TableIdentity DumpCatalog::ParseTableSchemaIdentity(const std::string &path)
{
	const std::string name = StringUtils::RemoveSuffix(BaseName(path), kTableSchemaSuffix);
	const auto segments = StringUtils::SplitByToken(name, ".");

	TableIdentity identity;
	identity.mDatabase = segments[0];
	if (segments.size() > 1)
	{
		identity.mTable = segments[1];
	}
	return identity;
}

TableIdentity DumpCatalog::ParseTableIdentity(const std::string &path)
{
	const std::string name = StringUtils::RemoveSuffix(BaseName(path), kTableDataSuffix);
	const auto segments = StringUtils::SplitByToken(name, ".");

	if (segments.size() < 2)
	{
		RestoreException::Context context;
		context.mFile = path;
		throw RestoreException("table file name must be <db>.<table>[.<part>].sql", context);
	}

	TableIdentity identity;
	identity.mDatabase = segments[0];
	identity.mTable = segments[1];
	if (segments.size() > 2)
	{
		identity.mPart = segments[2];
	}
	return identity;
}

} // namespace Restore
} // namespace DumpLoader
