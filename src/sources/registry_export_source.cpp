#include "registry_export_source.h"

#include "../errors.h"
#include "../helper/text_utils.h"
#include "../helper/time_utils.h"
#include "../parsers/registry_tree_parser.h"

#include <chrono>
#include <set>
#include <string>

#ifdef _WIN32
#include <windows.h>

#pragma comment(lib, "advapi32.lib")

namespace {

// Value names copied into the export; everything else in an uninstall
// key is irrelevant to the inventory record.
const char* const kExportedValues[] = {
    "DisplayName", "DisplayVersion", "Version", "Publisher",
    "InstallLocation", "InstallSource", "BundleCachePath", "InstallDate"
};

// The *A registry API returns text in the active code page; the export
// is UTF-8.
std::string ansiToUtf8(const std::string& ansi) {
    return codePageToUtf8(ansi, CP_ACP);
}

bool readRegString(HKEY key, const char* name, std::string& out) {
    out.clear();
    DWORD type = 0;
    DWORD size = 0;
    if (RegQueryValueExA(key, name, nullptr, &type, nullptr, &size) != ERROR_SUCCESS)
        return false;
    if ((type != REG_SZ && type != REG_EXPAND_SZ) || size == 0)
        return false;

    std::string buffer(size, '\0');
    if (RegQueryValueExA(key, name, nullptr, nullptr,
                         reinterpret_cast<LPBYTE>(&buffer[0]), &size) != ERROR_SUCCESS)
        return false;
    while (!buffer.empty() && buffer.back() == '\0')
        buffer.pop_back();
    out = ansiToUtf8(buffer);
    return true;
}

// "; LastWriteTime=2023-01-15T10:42:07Z" line for the key just opened.
// FILETIME counts 100 ns ticks since 1601-01-01.
std::string formatLastWriteComment(const FILETIME& ft) {
    const unsigned long long ticks =
        (static_cast<unsigned long long>(ft.dwHighDateTime) << 32) | ft.dwLowDateTime;
    const long long seconds = static_cast<long long>(ticks / 10000000ULL) - 11644473600LL;
    if (seconds <= 0)
        return {};
    return "; " + std::string(kLastWriteTimeTag) + "=" +
           formatIso8601(Timestamp(std::chrono::seconds(seconds))) + "\r\n";
}

// ─────────────────────────────────────────────────────────────
// Writes root\path and every direct subkey with its string values.
// A root that cannot be opened contributes nothing.
// ─────────────────────────────────────────────────────────────
void exportUninstallRoot(HKEY               root,
                         const std::string& rootName,
                         const std::string& path,
                         std::string&       out)
{
    HKEY uninstall = nullptr;
    if (RegOpenKeyExA(root, path.c_str(), 0, KEY_READ, &uninstall) != ERROR_SUCCESS)
        return;

    const std::string keyPath = rootName + "\\" + path;
    out += "[" + keyPath + "]\r\n\r\n";

    char subkeyName[512] = {};
    for (DWORD index = 0; ; ++index) {
        DWORD subkeySize = static_cast<DWORD>(sizeof(subkeyName));
        LONG rc = RegEnumKeyExA(uninstall, index, subkeyName, &subkeySize,
                                nullptr, nullptr, nullptr, nullptr);
        if (rc == ERROR_NO_MORE_ITEMS) break;
        if (rc != ERROR_SUCCESS)       continue;

        HKEY subkey = nullptr;
        if (RegOpenKeyExA(uninstall, subkeyName, 0, KEY_READ, &subkey) != ERROR_SUCCESS)
            continue;

        out += "[" + keyPath + "\\" + ansiToUtf8(subkeyName) + "]\r\n";

        FILETIME lastWrite = {};
        if (RegQueryInfoKeyA(subkey, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr,
                             nullptr, nullptr, nullptr, nullptr, &lastWrite) == ERROR_SUCCESS) {
            out += formatLastWriteComment(lastWrite);
        }

        std::string value;
        for (const char* name : kExportedValues) {
            if (readRegString(subkey, name, value))
                out += "\"" + std::string(name) + "\"=\"" + escapeRegString(value) + "\"\r\n";
        }
        out += "\r\n";

        RegCloseKey(subkey);
    }
    RegCloseKey(uninstall);
}

// ─────────────────────────────────────────────────────────────
// Per-user uninstall keys of every hive loaded under HKU.
// Offline users (hive not loaded) are not visible here.
// ─────────────────────────────────────────────────────────────
void exportAllUsersHku(std::string& out) {
    char sidName[256] = {};
    for (DWORD i = 0; ; ++i) {
        DWORD sidSize = sizeof(sidName);
        LONG rc = RegEnumKeyExA(HKEY_USERS, i, sidName, &sidSize,
                                nullptr, nullptr, nullptr, nullptr);
        if (rc == ERROR_NO_MORE_ITEMS) break;
        if (rc != ERROR_SUCCESS)       continue;

        const std::string sid(sidName);
        if (isSystemSid(sid)) continue;

        exportUninstallRoot(
            HKEY_USERS, "HKEY_USERS",
            sid + "\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall", out);

        exportUninstallRoot(
            HKEY_USERS, "HKEY_USERS",
            sid + "\\Software\\WOW6432Node\\Microsoft\\Windows\\CurrentVersion\\Uninstall", out);
    }
}

}  // namespace
#endif  // _WIN32

std::string escapeRegString(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\r':
            case '\n': out += ' ';    break;
            default:   out += c;      break;
        }
    }
    return out;
}

bool isSystemSid(const std::string& sid) {
    static const std::set<std::string> skip = {
        ".DEFAULT", "S-1-5-18", "S-1-5-19", "S-1-5-20"
    };
    if (skip.count(sid)) return true;
    return sid.size() > 8 && sid.substr(sid.size() - 8) == "_Classes";
}

std::string RegistryExportSource::fetch() {
#ifdef _WIN32
    std::string out = "Windows Registry Editor Version 5.00\r\n\r\n";

    // ── Machine-wide (64-bit view) ──────────────────────
    exportUninstallRoot(
        HKEY_LOCAL_MACHINE, "HKEY_LOCAL_MACHINE",
        "Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall", out);

    // ── Machine-wide (32-bit view on 64-bit OS) ─────────
    exportUninstallRoot(
        HKEY_LOCAL_MACHINE, "HKEY_LOCAL_MACHINE",
        "Software\\WOW6432Node\\Microsoft\\Windows\\CurrentVersion\\Uninstall", out);

    // ── Per-user: all loaded user hives via HKU ──────────
    exportAllUsersHku(out);

    return out;
#else
    throw SourceUnavailable("the Windows registry is not available on this operating system");
#endif
}
