#pragma once

// English: Scratch dump directory for tests, removed on destruction
// 한글: 테스트용 임시 덤프 디렉터리, 소멸 시 삭제

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>

namespace DumpLoader::Tests
{

class TempDumpDir
{
  public:
	explicit TempDumpDir(const std::string &tag)
	{
		std::random_device rd;
		mPath = std::filesystem::temp_directory_path() /
				("dumploader_" + tag + "_" + std::to_string(rd()) + std::to_string(rd()));
		std::filesystem::create_directories(mPath);
	}

	~TempDumpDir()
	{
		std::error_code ec;
		std::filesystem::remove_all(mPath, ec);
	}

	TempDumpDir(const TempDumpDir &) = delete;
	TempDumpDir &operator=(const TempDumpDir &) = delete;

	// English: Write a file (parent directories created); returns its full path
	// 한글: 파일 쓰기 (상위 디렉터리 생성); 전체 경로 반환
	std::string Write(const std::string &relativePath, const std::string &content) const
	{
		const std::filesystem::path target = mPath / relativePath;
		std::filesystem::create_directories(target.parent_path());

		std::ofstream out(target, std::ios::out | std::ios::binary | std::ios::trunc);
		if (!out.is_open())
		{
			throw std::runtime_error("cannot write " + target.string());
		}
		out << content;
		return target.string();
	}

	std::string MakeDir(const std::string &relativePath) const
	{
		const std::filesystem::path target = mPath / relativePath;
		std::filesystem::create_directories(target);
		return target.string();
	}

	std::string Path() const { return mPath.string(); }

	std::string PathOf(const std::string &relativePath) const { return (mPath / relativePath).string(); }

  private:
	std::filesystem::path mPath;
};

} // namespace DumpLoader::Tests
