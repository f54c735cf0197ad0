#pragma once

// ════════════════════════════════════════════════════════════════
//  registry_export_source.h
//
//  Walks the uninstall registry keys through the Win32 API and
//  renders them in registry export text, the same format
//  `reg export` writes, so RegistryTreeParser can consume it:
//
//    Windows Registry Editor Version 5.00
//
//    [HKEY_LOCAL_MACHINE\Software\...\Uninstall]
//
//    [HKEY_LOCAL_MACHINE\Software\...\Uninstall\{GUID}]
//    "DisplayName"="..."
//
//  Roots visited:
//    HKLM 64-bit view, HKLM WOW6432Node, and the 64/32-bit
//    uninstall keys of every user hive loaded under HKU
//    (system SIDs and _Classes hives skipped).
//
//  On other operating systems fetch() throws SourceUnavailable.
// ════════════════════════════════════════════════════════════════

#include "iraw_source.h"

class RegistryExportSource final : public IRawSource {
public:
    std::string fetch() override;
    std::string describe() const override { return "registry uninstall keys"; }
};

// Escapes backslashes and quotes the way registry export text does.
std::string escapeRegString(const std::string& value);

// True for .DEFAULT, S-1-5-18/19/20 and "<SID>_Classes" hives.
bool isSystemSid(const std::string& sid);
