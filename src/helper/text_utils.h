#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Decodes raw adapter output into UTF-8 text.
// Accepts UTF-8 (optional BOM) and UTF-16LE with BOM.
// Throws MalformedSource when the input is empty, blank, contains NUL
// bytes or is not valid in its encoding.
std::string decodeText(const std::string& raw, const std::string& sourceName);

// UTF-16LE byte sequence (no BOM) → UTF-8. Returns false on an odd byte
// count or an unpaired surrogate.
bool utf16LeToUtf8(const std::string& bytes, std::string& out);

bool isValidUtf8(const std::string& text);

#ifdef _WIN32
// Bytes in a Windows code page (CP_ACP, CP_OEMCP, a console page) → UTF-8.
// Returns "" when the conversion fails.
std::string codePageToUtf8(const std::string& bytes, unsigned int codePage);
#endif

std::string trim(const std::string& s);
std::string toLower(std::string s);
bool iequals(const std::string& a, const std::string& b);
bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);

// Splits on '\n', dropping a trailing '\r' from every line.
std::vector<std::string> splitLines(const std::string& text);

// Splits on every occurrence of separator; items are trimmed and empty
// items dropped.
std::vector<std::string> splitList(const std::string& text, const std::string& separator);

// Number of leading spaces; a tab counts as four.
std::size_t leadingIndent(const std::string& line);
