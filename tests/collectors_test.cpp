#include "collectors/linux_collector.h"
#include "collectors/macos_collector.h"
#include "collectors/windows_collector.h"

#include "errors.h"
#include "helper/time_utils.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

const char* kProfilerReport =
    "Software:\n"
    "\n"
    "    System Software Overview:\n"
    "\n"
    "      System Version: macOS 13.4 (22F66)\n"
    "      Kernel Version: Darwin 22.5.0\n"
    "\n"
    "Applications:\n"
    "\n"
    "    Google Drive:\n"
    "\n"
    "      Version: 62.0\n"
    "      Last Modified: 6/10/22, 10:27 AM\n"
    "      Signed by: Developer ID Application: Google LLC (EQHXZ8M8AV), "
    "Developer ID Certification Authority, Apple Root CA\n"
    "      Location: /Applications/Google Drive.app\n"
    "\n"
    "Extensions:\n"
    "\n"
    "    AppleHV:\n"
    "\n"
    "      Version: 1.0\n"
    "      Bundle ID: com.apple.driver.AppleHV\n"
    "      Signed by: Software Signing, Apple Code Signing Certification Authority, Apple Root CA\n"
    "      Location: /System/Library/Extensions/AppleHV.kext\n";

const char* kRegistryExport =
    "Windows Registry Editor Version 5.00\r\n"
    "\r\n"
    "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall]\r\n"
    "\r\n"
    "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\Git_is1]\r\n"
    "\"DisplayName\"=\"Git\"\r\n"
    "\"DisplayVersion\"=\"2.41.0\"\r\n"
    "\"Publisher\"=\"The Git Development Community\"\r\n";

const char* kDriverTable =
    "\"Module Name\",\"Display Name\",\"Link Date\",\"Path\"\r\n"
    "\"ACPI\",\"Microsoft ACPI Driver\",\"\",\"C:\\Windows\\system32\\drivers\\ACPI.sys\"\r\n";

const char* kDpkgStatus =
    "Package: bash\n"
    "Status: install ok installed\n"
    "Version: 5.2.15-2+b2\n"
    "Maintainer: Matthias Klose <doko@debian.org>\n"
    "\n"
    "Package: zsh\n"
    "Status: install ok installed\n"
    "Version: 5.9-4+b2\n"
    "Maintainer: Debian Zsh Maintainers <pkg-zsh-devel@lists.alioth.debian.org>\n";

std::vector<std::string> kinds(const InventoryResult& result) {
    std::vector<std::string> out;
    for (const auto& record : result.records)
        out.push_back(record.kind());
    return out;
}

}  // namespace

// ─────────────────────────────────────────────────────────────
//  macOS
// ─────────────────────────────────────────────────────────────

TEST(MacOsCollector, EmitsOsThenApplicationsThenExtensions) {
    MacOsCollector collector(staticSource("system_profiler", kProfilerReport));
    const InventoryResult result = collector.collect();

    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(kinds(result), (std::vector<std::string>{"OS", "Application", "Driver"}));

    const SoftwareRecord& os = result.records[0];
    EXPECT_EQ(os.name(), "macOS");
    EXPECT_EQ(os.version(), "13.4 (22F66)");
    EXPECT_EQ(os.path(), "/");
    EXPECT_EQ(os.modified(), epochSentinel());
    EXPECT_EQ(os.publishers(),
              (std::vector<std::string>{"Apple Code Signing Certification Authority",
                                        "Apple Root CA"}));

    EXPECT_EQ(result.records[1].id(), "Google Drive");
    EXPECT_EQ(result.records[2].id(), "com.apple.driver.AppleHV");
    EXPECT_EQ(result.records[2].name(), "AppleHV");
}

TEST(MacOsCollector, MissingSectionIsOneDiagnostic) {
    const std::string report =
        "Software:\n"
        "    System Software Overview:\n"
        "      System Version: macOS 12.4 (21F79)\n"
        "Applications:\n"
        "    Keynote:\n"
        "      Version: 12.2\n";

    MacOsCollector collector(staticSource("system_profiler", report));
    const InventoryResult result = collector.collect();

    EXPECT_EQ(kinds(result), (std::vector<std::string>{"OS", "Application"}));
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].location, "Extensions");
}

TEST(MacOsCollector, UnavailableProfilerFailsTheRun) {
    MacOsCollector collector(failingSource("system_profiler"));
    EXPECT_THROW(collector.collect(), CollectionFailed);
}

TEST(MacOsCollector, UnrecognizableReportFailsTheRun) {
    MacOsCollector collector(staticSource("system_profiler", "Hardware:\n    Model: Mac\n"));
    EXPECT_THROW(collector.collect(), CollectionFailed);
}

// ─────────────────────────────────────────────────────────────
//  Windows
// ─────────────────────────────────────────────────────────────

TEST(WindowsCollector, ParsesVerOutput) {
    EXPECT_EQ(WindowsCollector::parseVerOutput("\r\nMicrosoft Windows [Version 10.0.19045.3086]\r\n"),
              "10.0.19045.3086");
    EXPECT_EQ(WindowsCollector::parseVerOutput("Microsoft Windows [versione 10.0.22621.1848]"),
              "10.0.22621.1848");
    EXPECT_THROW(WindowsCollector::parseVerOutput("Microsoft Windows"), MalformedSource);
    EXPECT_THROW(WindowsCollector::parseVerOutput("Microsoft Windows [Version]"), MalformedSource);
}

TEST(WindowsCollector, LocalizedVerOutputInOemCodePage) {
    // Spanish "Versión" with 'ó' as CP850 byte 0xA2.
    WindowsCollector collector(
        staticSource("ver", "\r\nMicrosoft Windows [Versi\xA2n 10.0.19045.3086]\r\n"),
        staticSource("registry", kRegistryExport),
        failingSource("driverquery"));
    const InventoryResult result = collector.collect();

    ASSERT_FALSE(result.records.empty());
    EXPECT_EQ(result.records[0].kind(), RecordKind::OS);
    EXPECT_EQ(result.records[0].version(), "10.0.19045.3086");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].location, "Driver");
}

TEST(WindowsCollector, EmitsOsThenApplicationsThenDrivers) {
    WindowsCollector collector(
        staticSource("ver", "\r\nMicrosoft Windows [Version 10.0.19045.3086]\r\n"),
        staticSource("registry", kRegistryExport),
        staticSource("driverquery", kDriverTable));
    const InventoryResult result = collector.collect();

    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(kinds(result), (std::vector<std::string>{"OS", "Application", "Driver"}));

    const SoftwareRecord& os = result.records[0];
    EXPECT_EQ(os.name(), "Microsoft Windows");
    EXPECT_EQ(os.version(), "10.0.19045.3086");
    EXPECT_EQ(os.path(), "C:\\");
    EXPECT_EQ(os.publishers().size(), 2u);

    EXPECT_EQ(result.records[1].publishers(),
              std::vector<std::string>{"The Git Development Community"});
    EXPECT_EQ(result.records[2].id(), "ACPI");
}

TEST(WindowsCollector, FailedCategoryContributesOneDiagnostic) {
    WindowsCollector collector(
        staticSource("ver", "Microsoft Windows [Version 10.0.19045.3086]"),
        failingSource("registry"),
        staticSource("driverquery", kDriverTable));
    const InventoryResult result = collector.collect();

    EXPECT_EQ(kinds(result), (std::vector<std::string>{"OS", "Driver"}));
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].source, "registry");
    EXPECT_EQ(result.diagnostics[0].location, "Application");
}

TEST(WindowsCollector, UndecodableOutputIsTreatedAsFailedCategory) {
    WindowsCollector collector(
        staticSource("ver", "Microsoft Windows [Version 10.0.19045.3086]"),
        staticSource("registry", kRegistryExport),
        staticSource("driverquery", std::string("\x00\x01\x02", 3)));
    const InventoryResult result = collector.collect();

    EXPECT_EQ(kinds(result), (std::vector<std::string>{"OS", "Application"}));
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].location, "Driver");
}

TEST(WindowsCollector, EveryCategoryFailingFailsTheRun) {
    WindowsCollector collector(failingSource("ver"), failingSource("registry"),
                               failingSource("driverquery"));
    EXPECT_THROW(collector.collect(), CollectionFailed);
}

// ─────────────────────────────────────────────────────────────
//  Linux
// ─────────────────────────────────────────────────────────────

TEST(LinuxCollector, ParsesOsRelease) {
    EXPECT_EQ(LinuxCollector::parseOsRelease("NAME=\"Debian GNU/Linux\"\nVERSION_ID=\"12\"\n"), "12");
    EXPECT_EQ(LinuxCollector::parseOsRelease("# comment\nVERSION='rolling'\n"), "rolling");
    EXPECT_THROW(LinuxCollector::parseOsRelease("NAME=Arch\n"), MalformedSource);
}

TEST(LinuxCollector, EmitsOsThenPackages) {
    LinuxCollector collector(staticSource("/etc/os-release", "ID=debian\nVERSION_ID=\"12\"\n"),
                             staticSource("dpkg-query", kDpkgStatus));
    const InventoryResult result = collector.collect();

    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(kinds(result), (std::vector<std::string>{"OS", "Package", "Package"}));
    EXPECT_EQ(result.records[0].name(), "Linux");
    EXPECT_EQ(result.records[0].version(), "12");
    EXPECT_TRUE(result.records[0].publishers().empty());
    EXPECT_EQ(result.records[1].id(), "bash");
    EXPECT_EQ(result.records[2].version(), "5.9-4+b2");
}

TEST(LinuxCollector, MissingPackageDatabaseDegrades) {
    LinuxCollector collector(staticSource("/etc/os-release", "VERSION_ID=22.04\n"),
                             failingSource("dpkg-query"));
    const InventoryResult result = collector.collect();

    EXPECT_EQ(kinds(result), std::vector<std::string>{"OS"});
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].location, "Package");
}

TEST(LinuxCollector, NothingCollectableFailsTheRun) {
    LinuxCollector collector(failingSource("/etc/os-release"), failingSource("dpkg-query"));
    EXPECT_THROW(collector.collect(), CollectionFailed);
}
