#include "linux_collector.h"

#include "category.h"
#include "../errors.h"
#include "../helper/logger.h"
#include "../helper/text_utils.h"
#include "../helper/time_utils.h"

#include <initializer_list>
#include <map>
#include <utility>

LinuxCollector::LinuxCollector(std::unique_ptr<IRawSource> osReleaseSource,
                               std::unique_ptr<IRawSource> packageSource)
    : osReleaseSource(std::move(osReleaseSource)),
      packageSource(std::move(packageSource)) {}

BlockFieldTable LinuxCollector::packageTable() {
    BlockFieldTable table;
    table.kind          = RecordKind::Package;
    table.nameKey       = "Package";
    table.idKey         = "Package";
    table.versionKey    = "Version";
    table.publishersKey = "Maintainer";
    table.requiredKey   = "Status";
    table.requiredValue = "install ok installed";
    return table;
}

std::string LinuxCollector::parseOsRelease(const std::string& text) {
    std::map<std::string, std::string> fields;
    for (const auto& line : splitLines(text)) {
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#')
            continue;
        const auto eq = content.find('=');
        if (eq == std::string::npos)
            continue;

        std::string value = trim(content.substr(eq + 1));
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            value = value.substr(1, value.size() - 2);
        fields[trim(content.substr(0, eq))] = value;
    }

    for (const char* key : {"VERSION_ID", "VERSION"}) {
        auto it = fields.find(key);
        if (it != fields.end() && !it->second.empty())
            return it->second;
    }
    throw MalformedSource("os-release: neither VERSION_ID nor VERSION is set");
}

InventoryResult LinuxCollector::collect() {
    logInfo("collecting installed packages, please wait ...");

    InventoryResult result;

    std::string osVersion;
    const bool osCollected = collectCategory(
        "OS", *osReleaseSource,
        [&](const std::string& raw) {
            osVersion = parseOsRelease(decodeText(raw, osReleaseSource->describe()));
            return std::vector<ParseResult>{};
        },
        result);

    result.records.emplace_back(RecordKind::OS, "Linux", "Linux", osVersion, "/",
                                epochSentinel(), std::vector<std::string>{});

    const BlockParser parser(BlockLayout::Stanza, packageSource->describe());
    const bool packagesCollected = collectCategory(
        "Package", *packageSource,
        [&](const std::string& raw) { return parser.parse(raw, packageTable()); },
        result);

    if (!osCollected && !packagesCollected)
        throw CollectionFailed("no inventory category could be collected on this host");

    return result;
}
