#include "text_utils.h"

#include "../errors.h"

#include <algorithm>
#include <cctype>

#ifdef _WIN32
#include <windows.h>
#endif

namespace {

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

bool utf16LeToUtf8(const std::string& bytes, std::string& out) {
    out.clear();
    if (bytes.size() % 2 != 0)
        return false;

    out.reserve(bytes.size() / 2);
    for (std::size_t i = 0; i < bytes.size(); i += 2) {
        unsigned long unit = static_cast<unsigned char>(bytes[i]) |
                             (static_cast<unsigned char>(bytes[i + 1]) << 8);

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 3 >= bytes.size())
                return false;
            unsigned long low = static_cast<unsigned char>(bytes[i + 2]) |
                                (static_cast<unsigned char>(bytes[i + 3]) << 8);
            if (low < 0xDC00 || low > 0xDFFF)
                return false;
            appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            i += 2;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            return false;
        } else {
            appendUtf8(out, unit);
        }
    }
    return true;
}

bool isValidUtf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        if (c < 0x80)                extra = 0;
        else if ((c & 0xE0) == 0xC0) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0) extra = 3;
        else return false;

        if (extra == 1 && c < 0xC2)
            return false;  // overlong
        if (c > 0xF4)
            return false;  // beyond U+10FFFF
        if (i + extra >= text.size())
            return false;  // truncated sequence

        // RFC 3629: the second byte narrows for these leads.
        if (extra > 0) {
            const unsigned char second = static_cast<unsigned char>(text[i + 1]);
            unsigned char low = 0x80;
            unsigned char high = 0xBF;
            if (c == 0xE0)      low = 0xA0;   // overlong
            else if (c == 0xED) high = 0x9F;  // UTF-16 surrogates
            else if (c == 0xF0) low = 0x90;   // overlong
            else if (c == 0xF4) high = 0x8F;  // beyond U+10FFFF
            if (second < low || second > high)
                return false;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80)
                return false;
        }
        i += extra + 1;
    }
    return true;
}

#ifdef _WIN32
std::string codePageToUtf8(const std::string& bytes, unsigned int codePage) {
    if (bytes.empty())
        return {};
    const int wideLen = MultiByteToWideChar(codePage, 0, bytes.data(),
                                            static_cast<int>(bytes.size()), nullptr, 0);
    if (wideLen <= 0)
        return {};
    std::wstring wide(static_cast<std::size_t>(wideLen), L'\0');
    MultiByteToWideChar(codePage, 0, bytes.data(), static_cast<int>(bytes.size()),
                        &wide[0], wideLen);

    const int utf8Len = WideCharToMultiByte(CP_UTF8, 0, wide.data(), wideLen,
                                            nullptr, 0, nullptr, nullptr);
    if (utf8Len <= 0)
        return {};
    std::string utf8(static_cast<std::size_t>(utf8Len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), wideLen, &utf8[0], utf8Len, nullptr, nullptr);
    return utf8;
}
#endif

std::string decodeText(const std::string& raw, const std::string& sourceName) {
    if (raw.empty())
        throw MalformedSource(sourceName + ": empty output");

    std::string text;
    if (raw.size() >= 2 &&
        static_cast<unsigned char>(raw[0]) == 0xFF &&
        static_cast<unsigned char>(raw[1]) == 0xFE) {
        if (!utf16LeToUtf8(raw.substr(2), text))
            throw MalformedSource(sourceName + ": invalid UTF-16 output");
    } else if (raw.size() >= 3 && raw.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text = raw.substr(3);
    } else {
        text = raw;
    }

    if (text.find('\0') != std::string::npos)
        throw MalformedSource(sourceName + ": output contains NUL bytes");
    if (!isValidUtf8(text))
        throw MalformedSource(sourceName + ": output is not valid UTF-8 text");
    if (isBlank(text))
        throw MalformedSource(sourceName + ": empty output");

    return text;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && toLower(a) == toLower(b);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos)
            end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    if (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

std::vector<std::string> splitList(const std::string& text, const std::string& separator) {
    std::vector<std::string> items;
    if (separator.empty()) {
        std::string item = trim(text);
        if (!item.empty())
            items.push_back(std::move(item));
        return items;
    }

    std::size_t start = 0;
    while (true) {
        const std::size_t pos = text.find(separator, start);
        std::string item = trim(text.substr(start, pos == std::string::npos
                                                       ? std::string::npos
                                                       : pos - start));
        if (!item.empty())
            items.push_back(std::move(item));
        if (pos == std::string::npos)
            break;
        start = pos + separator.size();
    }
    return items;
}

std::size_t leadingIndent(const std::string& line) {
    std::size_t indent = 0;
    for (char c : line) {
        if (c == ' ')       indent += 1;
        else if (c == '\t') indent += 4;
        else break;
    }
    return indent;
}
