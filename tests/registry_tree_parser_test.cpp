#include "parsers/registry_tree_parser.h"

#include "errors.h"
#include "helper/time_utils.h"
#include "sources/registry_export_source.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

const char* kUninstallExport =
    "Windows Registry Editor Version 5.00\r\n"
    "\r\n"
    "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall]\r\n"
    "\r\n"
    "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\7-Zip]\r\n"
    "\"DisplayName\"=\"7-Zip 22.01 (x64)\"\r\n"
    "\"DisplayVersion\"=\"22.01\"\r\n"
    "\"Publisher\"=\"Igor Pavlov\"\r\n"
    "\"InstallLocation\"=\"C:\\\\Program Files\\\\7-Zip\\\\\"\r\n"
    "\"EstimatedSize\"=dword:00001600\r\n"
    "\r\n"
    "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\AddressBook]\r\n"
    "\r\n"
    "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\{23170F69-40C1-2702-2201-000001000000}]\r\n"
    "\"DisplayName\"=\"Microsoft Visual C++ 2015-2022 Redistributable (x64)\"\r\n"
    "\"Version\"=\"14.34.31938\"\r\n"
    "\"InstallSource\"=\"C:\\\\ProgramData\\\\Package Cache\\\\\"\r\n"
    "\"InstallDate\"=\"20230115\"\r\n";

}  // namespace

TEST(RegistryTreeParser, EachSubkeyOfAnExportedRootIsOneItem) {
    const RegistryTreeParser parser;
    const InventoryResult result = split(parser.parse(kUninstallExport));

    // AddressBook has no DisplayName: skipped, no diagnostic.
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_TRUE(result.diagnostics.empty());

    const SoftwareRecord& zip = result.records[0];
    EXPECT_EQ(zip.kind(), RecordKind::Application);
    EXPECT_EQ(zip.name(), "7-Zip 22.01 (x64)");
    EXPECT_EQ(zip.id(), "7-Zip");
    EXPECT_EQ(zip.version(), "22.01");
    EXPECT_EQ(zip.path(), "C:\\Program Files\\7-Zip\\");
    EXPECT_EQ(zip.publishers(), std::vector<std::string>{"Igor Pavlov"});
    EXPECT_EQ(zip.modified(), epochSentinel());

    const SoftwareRecord& vcredist = result.records[1];
    EXPECT_EQ(vcredist.id(), "{23170F69-40C1-2702-2201-000001000000}");
    EXPECT_EQ(vcredist.version(), "14.34.31938");
    EXPECT_EQ(vcredist.path(), "C:\\ProgramData\\Package Cache\\");
    EXPECT_TRUE(vcredist.publishers().empty());
    EXPECT_EQ(vcredist.modified(), makeUtcTimestamp(2023, 1, 15));
}

TEST(RegistryTreeParser, LastWriteTimeDatesEntriesWithoutInstallDate) {
    const std::string text =
        "Windows Registry Editor Version 5.00\r\n"
        "\r\n"
        "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall]\r\n"
        "\r\n"
        "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\Notepad++]\r\n"
        "; LastWriteTime=2023-03-04T09:15:30Z\r\n"
        "\"DisplayName\"=\"Notepad++ (64-bit x64)\"\r\n"
        "\r\n"
        "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\VLC]\r\n"
        "; LastWriteTime=2023-03-04T09:15:30Z\r\n"
        "\"DisplayName\"=\"VLC media player\"\r\n"
        "\"InstallDate\"=\"20220920\"\r\n"
        "\r\n"
        "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\Undated]\r\n"
        "; exported by hand\r\n"
        "\"DisplayName\"=\"Undated\"\r\n";

    const RegistryTreeParser parser;
    const InventoryResult result = split(parser.parse(text));

    ASSERT_EQ(result.records.size(), 3u);
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(result.records[0].modified(), makeUtcTimestamp(2023, 3, 4, 9, 15, 30));
    EXPECT_EQ(result.records[1].modified(), makeUtcTimestamp(2022, 9, 20));
    EXPECT_EQ(result.records[2].modified(), epochSentinel());
}

TEST(RegistryTreeParser, BuildsTreeFromPaths) {
    const RegistryTreeParser parser;
    std::vector<ParseDiagnostic> diagnostics;
    const RegistryTree tree = parser.buildTree(kUninstallExport, diagnostics);

    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tree.keys.size(), 4u);
    ASSERT_EQ(tree.roots.size(), 1u);
    EXPECT_EQ(tree.keys[tree.roots[0]].name, "Uninstall");
    EXPECT_EQ(tree.keys[tree.roots[0]].children.size(), 3u);
    EXPECT_EQ(RegistryTree::value(tree.keys[1], "estimatedsize"), "5632");
}

TEST(RegistryTreeParser, DecodesUtf16ExportWithHexValues) {
    // reg export writes UTF-16LE; hex(2) carries an expandable string.
    const std::string text =
        "Windows Registry Editor Version 5.00\r\n"
        "\r\n"
        "[HKEY_USERS\\S-1-5-21-1\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall]\r\n"
        "\r\n"
        "[HKEY_USERS\\S-1-5-21-1\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\Tool]\r\n"
        "\"DisplayName\"=\"Tool\"\r\n"
        "\"InstallLocation\"=hex(2):25,00,41,00,\\\r\n"
        "  50,00,50,00,25,00,00,00\r\n"
        "\"Blob\"=hex:01,02,03\r\n";

    std::string raw("\xFF\xFE", 2);
    for (char c : text) {
        raw += c;
        raw += '\0';
    }

    const RegistryTreeParser parser("reg export");
    const InventoryResult result = split(parser.parse(raw));

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(result.records[0].path(), "%APP%");
}

TEST(RegistryTreeParser, UnreadableValueIsDiagnosedAndParsingContinues) {
    const std::string text =
        "[HKEY_LOCAL_MACHINE\\Uninstall]\n"
        "[HKEY_LOCAL_MACHINE\\Uninstall\\Broken]\n"
        "\"DisplayName\"=\"Broken\"\n"
        "\"DisplayVersion\"=dword:zzzz\n"
        "[HKEY_LOCAL_MACHINE\\Uninstall\\Fine]\n"
        "\"DisplayName\"=\"Fine\"\n";

    const RegistryTreeParser parser;
    const auto results = parser.parse(text);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(isRecord(results[0]));
    EXPECT_FALSE(isRecord(results[1]));
    EXPECT_TRUE(isRecord(results[2]));

    const InventoryResult result = split(parser.parse(text));
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].location, "line 4 in HKEY_LOCAL_MACHINE\\Uninstall\\Broken");
    EXPECT_EQ(result.records[0].version(), "");
}

TEST(RegistryTreeParser, IgnoresDeletedKeysAndComments) {
    const std::string text =
        "REGEDIT4\n"
        "; exported for testing\n"
        "[-HKEY_LOCAL_MACHINE\\Uninstall\\Gone]\n"
        "\"DisplayName\"=\"Gone\"\n"
        "[HKEY_LOCAL_MACHINE\\Uninstall]\n"
        "[HKEY_LOCAL_MACHINE\\Uninstall\\Kept]\n"
        "@=\"default\"\n"
        "\"DisplayName\"=\"Kept\"\n";

    const RegistryTreeParser parser;
    const InventoryResult result = split(parser.parse(text));

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(result.records[0].id(), "Kept");
}

TEST(RegistryTreeParser, RejectsOutputWithoutKeys) {
    const RegistryTreeParser parser;
    EXPECT_THROW(parser.parse("Windows Registry Editor Version 5.00\r\n\r\n"), MalformedSource);
    EXPECT_THROW(parser.parse(""), MalformedSource);
}

TEST(RegistryExportSource, EscapesLikeRegExport) {
    EXPECT_EQ(escapeRegString("C:\\Program Files\\\"Q\""), "C:\\\\Program Files\\\\\\\"Q\\\"");
}

TEST(RegistryExportSource, RecognizesSystemHives) {
    EXPECT_TRUE(isSystemSid(".DEFAULT"));
    EXPECT_TRUE(isSystemSid("S-1-5-18"));
    EXPECT_TRUE(isSystemSid("S-1-5-21-1004336348-1177238915-682003330-1001_Classes"));
    EXPECT_FALSE(isSystemSid("S-1-5-21-1004336348-1177238915-682003330-1001"));
}
