#pragma once

#include <string>

// Product version from a PE file's version resource ("10.0.19041.1"),
// or "" when the file has none, cannot be read, or the host is not
// Windows.
std::string readFileVersion(const std::string& path);
