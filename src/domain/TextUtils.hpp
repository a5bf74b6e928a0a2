/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the notes codec.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace notestamp::domain::text {

bool IsSpace(char c);
bool IsDigit(char c);
bool IsAlpha(char c);

/// Copy of @p s without leading and trailing ASCII whitespace.
std::string Trim(const std::string& s);

/// Copy of @p s without trailing ASCII whitespace. Leading whitespace is kept.
std::string TrimEnd(const std::string& s);

std::string ToLower(std::string s);

/**
 * @brief Reads between @p minCount and @p maxCount decimal digits at @p pos.
 * Advances @p pos past the digits on success.
 */
bool ReadDigits(const std::string& s, std::size_t& pos, std::size_t minCount, std::size_t maxCount, int& out);

/// Splits on '\n' after folding "\r\n" to '\n'. Keeps empty trailing pieces.
std::vector<std::string> SplitLines(const std::string& s);

/// Appends @p tail to @p head on a new line. An empty @p head is replaced, not joined.
std::string JoinWithNewline(const std::string& head, const std::string& tail);

} // namespace notestamp::domain::text
