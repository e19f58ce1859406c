#pragma once

// English: String utility functions
// 한글: 문자열 유틸리티 함수

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace DumpLoader::Utils
{
// =============================================================================
// English: StringUtils - string manipulation utilities
// 한글: StringUtils - 문자열 조작 유틸리티
// =============================================================================

class StringUtils
{
public:
	// English: Trim whitespace from both ends of a string
	// 한글: 문자열 양쪽 끝의 공백 제거
	static std::string Trim(const std::string &str)
	{
		size_t start = str.find_first_not_of(" \t\n\r");
		if (start == std::string::npos)
			return "";

		size_t end = str.find_last_not_of(" \t\n\r");
		return str.substr(start, end - start + 1);
	}

	// English: Split string on a literal multi-character token. Every piece is kept,
	//          including empty ones, so N tokens always give N + 1 pieces.
	// 한글: 리터럴 다중 문자 토큰으로 문자열 분리. 빈 조각도 모두 유지하므로
	//       토큰이 N개면 항상 N + 1개의 조각이 생김.
	static std::vector<std::string> SplitByToken(const std::string &str, const std::string &token)
	{
		std::vector<std::string> result;
		if (token.empty())
		{
			result.push_back(str);
			return result;
		}

		size_t start = 0;
		for (;;)
		{
			size_t pos = str.find(token, start);
			if (pos == std::string::npos)
			{
				result.push_back(str.substr(start));
				break;
			}
			result.push_back(str.substr(start, pos - start));
			start = pos + token.size();
		}
		return result;
	}

	static bool StartsWith(const std::string &str, const std::string &prefix)
	{
		return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
	}

	static bool EndsWith(const std::string &str, const std::string &suffix)
	{
		return str.size() >= suffix.size() &&
			   str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
	}

	// English: Remove a literal suffix once (never a character set)
	// 한글: 리터럴 접미사를 한 번만 제거 (문자 집합 트리밍 아님)
	static std::string RemoveSuffix(const std::string &str, const std::string &suffix)
	{
		if (!EndsWith(str, suffix))
			return str;
		return str.substr(0, str.size() - suffix.size());
	}

	// English: Check if string is empty or contains only whitespace
	// 한글: 문자열이 비어있거나 공백만 포함하는지 확인
	static bool IsEmpty(const std::string &str)
	{
		return str.empty() || Trim(str).empty();
	}

	// English: Convert string to uppercase
	// 한글: 문자열을 대문자로 변환
	static std::string ToUpper(const std::string &str)
	{
		std::string result = str;
		std::transform(result.begin(), result.end(), result.begin(),
					   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
		return result;
	}

	// English: Convert string to lowercase
	// 한글: 문자열을 소문자로 변환
	static std::string ToLower(const std::string &str)
	{
		std::string result = str;
		std::transform(result.begin(), result.end(), result.begin(),
					   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return result;
	}
};

} // namespace DumpLoader::Utils
