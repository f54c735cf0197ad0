#include "file_version.h"

#include "../helper/logger.h"

#ifdef _WIN32
#include <windows.h>
#include <vector>

#pragma comment(lib, "version.lib")

std::string readFileVersion(const std::string& path) {
    DWORD handle = 0;
    const DWORD size = GetFileVersionInfoSizeA(path.c_str(), &handle);
    if (size == 0) {
        logDebug("GetFileVersionInfoSizeA failed for " + path + " with " +
                 std::to_string(GetLastError()));
        return {};
    }

    std::vector<unsigned char> buffer(size);
    if (!GetFileVersionInfoA(path.c_str(), 0, size, buffer.data())) {
        logDebug("GetFileVersionInfoA failed for " + path + " with " +
                 std::to_string(GetLastError()));
        return {};
    }

    VS_FIXEDFILEINFO* info = nullptr;
    UINT infoSize = 0;
    if (!VerQueryValueA(buffer.data(), "\\", reinterpret_cast<LPVOID*>(&info), &infoSize) ||
        info == nullptr || infoSize < sizeof(VS_FIXEDFILEINFO)) {
        logDebug("VerQueryValueA failed for " + path);
        return {};
    }

    return std::to_string(HIWORD(info->dwProductVersionMS)) + "." +
           std::to_string(LOWORD(info->dwProductVersionMS)) + "." +
           std::to_string(HIWORD(info->dwProductVersionLS)) + "." +
           std::to_string(LOWORD(info->dwProductVersionLS));
}

#else

std::string readFileVersion(const std::string&) {
    return {};
}

#endif  // _WIN32
