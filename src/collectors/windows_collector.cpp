#include "windows_collector.h"

#include "category.h"
#include "../errors.h"
#include "../helper/logger.h"
#include "../helper/text_utils.h"
#include "../helper/time_utils.h"
#include "../parsers/registry_tree_parser.h"
#include "../sources/file_version.h"

#include <cctype>
#include <utility>

WindowsCollector::WindowsCollector(std::unique_ptr<IRawSource> versionSource,
                                   std::unique_ptr<IRawSource> registrySource,
                                   std::unique_ptr<IRawSource> driverSource)
    : versionSource(std::move(versionSource)),
      registrySource(std::move(registrySource)),
      driverSource(std::move(driverSource)) {}

TableColumnMap WindowsCollector::driverColumns() {
    TableColumnMap columns;
    columns.kind           = RecordKind::Driver;
    columns.idColumn       = "Module Name";
    columns.nameColumn     = "Display Name";
    columns.pathColumn     = "Path";
    columns.modifiedColumn = "Link Date";
    return columns;
}

std::string WindowsCollector::parseVerOutput(const std::string& text) {
    const auto open = text.find('[');
    const auto close = text.find(']', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || close == std::string::npos)
        throw MalformedSource("ver: no bracketed version in output");

    // "[Version 10.0.19045.3086]"; the word is localized and may be in any
    // code page, the number is ASCII. Only the last token is read.
    const std::string inside = trim(text.substr(open + 1, close - open - 1));
    const auto space = inside.find_last_of(" \t");
    const std::string version = space == std::string::npos ? inside : inside.substr(space + 1);
    if (version.empty() || !std::isdigit(static_cast<unsigned char>(version[0])) ||
        version.find_first_not_of("0123456789.") != std::string::npos)
        throw MalformedSource("ver: no version number in output");
    return version;
}

InventoryResult WindowsCollector::collect() {
    logInfo("collecting applications and drivers, please wait ...");

    InventoryResult result;

    std::string osVersion;
    const bool osCollected = collectCategory(
        "OS", *versionSource,
        [&](const std::string& raw) {
            osVersion = parseVerOutput(raw);
            return std::vector<ParseResult>{};
        },
        result);

    result.records.emplace_back(RecordKind::OS, "Microsoft Windows", "Microsoft Windows",
                                osVersion, "C:\\", epochSentinel(),
                                std::vector<std::string>{
                                    "Microsoft Windows Production PCA 2011",
                                    "Microsoft Root Certificate Authority 2010"});

    const RegistryTreeParser registryParser(registrySource->describe());
    const bool appsCollected = collectCategory(
        "Application", *registrySource,
        [&](const std::string& raw) { return registryParser.parse(raw); },
        result);

    InventoryResult drivers;
    const TableParser driverParser(driverSource->describe());
    const bool driversCollected = collectCategory(
        "Driver", *driverSource,
        [&](const std::string& raw) { return driverParser.parse(raw, driverColumns()); },
        drivers);

    for (auto& driver : drivers.records) {
        std::string version = driver.version();
        if (version.empty() && !driver.path().empty())
            version = readFileVersion(driver.path());
        result.records.emplace_back(driver.kind(), driver.name(), driver.id(), version,
                                    driver.path(), driver.modified(), driver.publishers());
    }
    result.diagnostics.insert(result.diagnostics.end(),
                              drivers.diagnostics.begin(), drivers.diagnostics.end());

    if (!osCollected && !appsCollected && !driversCollected)
        throw CollectionFailed("no inventory category could be collected on this host");

    return result;
}
