#include "helper/json_exporter.h"
#include "helper/json_importer.h"
#include "helper/output_formatter.h"

#include "aggregator.h"
#include "collectors/macos_collector.h"
#include "errors.h"
#include "helper/time_utils.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

namespace {

const char* kGoogleDriveReport =
    "Software:\n"
    "\n"
    "    System Software Overview:\n"
    "\n"
    "      System Version: macOS 12.4 (21F79)\n"
    "\n"
    "Applications:\n"
    "\n"
    "    Google Drive:\n"
    "\n"
    "      Version: 62.0\n"
    "      Obtained from: Identified Developer\n"
    "      Last Modified: 6/10/22, 10:27 AM\n"
    "      Kind: Universal\n"
    "      Signed by: Developer ID Application: Google LLC (EQHXZ8M8AV), "
    "Developer ID Certification Authority, Apple Root CA\n"
    "      Location: /Applications/Google Drive.app\n"
    "\n"
    "Extensions:\n"
    "\n";

std::vector<SoftwareRecord> sampleRecords() {
    return {
        SoftwareRecord(RecordKind::OS, "Linux", "Linux", "12", "/", epochSentinel(), {}),
        SoftwareRecord(RecordKind::Package, "bash", "bash", "5.2.15-2+b2", "",
                       makeUtcTimestamp(2023, 6, 1, 12, 0, 0),
                       {"Matthias Klose <doko@debian.org>"}),
        SoftwareRecord("Firmware", "UEFI \"Setup\"", "uefi", "", "C:\\EFI\\Boot",
                       epochSentinel(), {"Vendor\tA", "Root"}),
        SoftwareRecord(RecordKind::Package, "zsh", "zsh", "5.9-4+b2", "", epochSentinel(), {}),
    };
}

}  // namespace

TEST(OutputFormatter, SummaryGroupsByKindInOrderOfFirstAppearance) {
    const std::string text = formatInventory(sampleRecords(), OutputMode::Summary);

    EXPECT_EQ(text,
              "[OS]\n"
              "  Linux 12\n"
              "\n"
              "[Package]\n"
              "  bash 5.2.15-2+b2\n"
              "  zsh 5.9-4+b2\n"
              "\n"
              "[Firmware]\n"
              "  UEFI \"Setup\"\n");
}

TEST(OutputFormatter, EmptyInventory) {
    EXPECT_EQ(formatInventory({}, OutputMode::Summary), "");
    EXPECT_EQ(formatInventory({}, OutputMode::Structured), "[]\n");
}

TEST(OutputFormatter, ParsesModeNames) {
    OutputMode mode = OutputMode::Summary;
    EXPECT_TRUE(parseOutputMode("JSON", mode));
    EXPECT_EQ(mode, OutputMode::Structured);
    EXPECT_TRUE(parseOutputMode("text", mode));
    EXPECT_EQ(mode, OutputMode::Summary);
    EXPECT_FALSE(parseOutputMode("yaml", mode));
}

TEST(JsonExporter, WritesEveryFieldOfEveryRecord) {
    const std::vector<SoftwareRecord> records = {
        SoftwareRecord(RecordKind::OS, "macOS", "macOS", "13.4", "/", epochSentinel(), {}),
    };
    const JsonExporter exporter;
    EXPECT_EQ(exporter.exportToString(records),
              "[\n"
              "  {\n"
              "    \"kind\": \"OS\",\n"
              "    \"name\": \"macOS\",\n"
              "    \"id\": \"macOS\",\n"
              "    \"version\": \"13.4\",\n"
              "    \"path\": \"/\",\n"
              "    \"modified\": \"1970-01-01T00:00:00Z\",\n"
              "    \"publishers\": []\n"
              "  }\n"
              "]\n");
}

TEST(JsonExporter, StructuredOutputRoundTrips) {
    const std::vector<SoftwareRecord> records = sampleRecords();

    const JsonExporter exporter;
    const JsonImporter importer;
    const std::vector<SoftwareRecord> restored =
        importer.importFromString(exporter.exportToString(records));

    EXPECT_EQ(restored, records);
    EXPECT_EQ(restored[0].modified(), epochSentinel());
    EXPECT_TRUE(restored[0].publishers().empty());
    EXPECT_EQ(restored[2].kind(), "Firmware");
}

TEST(JsonExporter, FileRoundTrip) {
    const std::string path = ::testing::TempDir() + "unisbom_inventory.json";
    const std::vector<SoftwareRecord> records = sampleRecords();

    const JsonExporter exporter;
    exporter.exportToFile(records, path);

    const JsonImporter importer;
    EXPECT_EQ(importer.importFromFile(path), records);
    std::remove(path.c_str());
}

TEST(JsonImporter, RejectsMalformedDocuments) {
    const JsonImporter importer;
    EXPECT_THROW(importer.importFromString("not json"), MalformedSource);
    EXPECT_THROW(importer.importFromString("{\"kind\": \"OS\"}"), MalformedSource);
    EXPECT_THROW(importer.importFromString("[{\"kind\": \"OS\", \"name\": \"x\"}]"),
                 MalformedSource);
    EXPECT_THROW(importer.importFromString(
                     "[{\"kind\":\"OS\",\"name\":\"x\",\"id\":\"x\",\"version\":\"\","
                     "\"path\":\"\",\"modified\":\"yesterday\",\"publishers\":[]}]"),
                 MalformedSource);
    EXPECT_THROW(importer.importFromString(
                     "[{\"kind\":\"\",\"name\":\"x\",\"id\":\"x\",\"version\":\"\","
                     "\"path\":\"\",\"modified\":\"1970-01-01T00:00:00Z\",\"publishers\":[]}]"),
                 MalformedSource);
    EXPECT_THROW(importer.importFromFile(::testing::TempDir() + "unisbom_missing.json"),
                 SourceUnavailable);
}

TEST(EndToEnd, GoogleDriveApplication) {
    MacOsCollector collector(staticSource("system_profiler", kGoogleDriveReport));
    const Aggregator aggregator;
    const InventoryResult inventory = aggregator.run(collector);

    const std::string summary = formatInventory(inventory.records, OutputMode::Summary);
    EXPECT_NE(summary.find("[Application]\n  Google Drive 62.0\n"), std::string::npos);

    const JsonImporter importer;
    const auto structured =
        importer.importFromString(formatInventory(inventory.records, OutputMode::Structured));

    ASSERT_EQ(structured.size(), 2u);
    const SoftwareRecord& drive = structured[1];
    EXPECT_EQ(drive.kind(), "Application");
    EXPECT_EQ(drive.id(), "Google Drive");
    EXPECT_EQ(drive.version(), "62.0");
    EXPECT_EQ(drive.modified(), makeUtcTimestamp(2022, 6, 10, 10, 27));
    EXPECT_EQ(drive.publishers(),
              (std::vector<std::string>{"Developer ID Application: Google LLC (EQHXZ8M8AV)",
                                        "Developer ID Certification Authority",
                                        "Apple Root CA"}));
}
