#include "macos_collector.h"

#include "../errors.h"
#include "../helper/logger.h"
#include "../helper/text_utils.h"
#include "../helper/time_utils.h"

#include <initializer_list>
#include <utility>

namespace {

constexpr const char* kSource = "system_profiler";

const TextSection* findSection(const std::vector<TextSection>& sections, const char* name) {
    for (const auto& section : sections) {
        if (iequals(section.name, name))
            return &section;
    }
    return nullptr;
}

// Parses one section body; a missing or empty section is one diagnostic.
void collectSection(const std::vector<TextSection>& sections,
                    const char* name,
                    const BlockFieldTable& table,
                    InventoryResult& into)
{
    const TextSection* section = findSection(sections, name);
    if (!section) {
        into.diagnostics.push_back({kSource, name, "section not present in report"});
        return;
    }

    const BlockParser parser(BlockLayout::Indented, std::string(kSource) + "/" + name);
    try {
        appendResults(parser.parse(section->body, table), into);
    } catch (const MalformedSource& ex) {
        into.diagnostics.push_back({kSource, name, ex.what()});
    }
}

}  // namespace

MacOsCollector::MacOsCollector(std::unique_ptr<IRawSource> profiler)
    : profiler(std::move(profiler)) {}

BlockFieldTable MacOsCollector::applicationTable() {
    BlockFieldTable table;
    table.kind          = RecordKind::Application;
    table.versionKey    = "Version";
    table.pathKey       = "Location";
    table.modifiedKey   = "Last Modified";
    table.publishersKey = "Signed by";
    table.listSeparator = ", ";
    return table;
}

BlockFieldTable MacOsCollector::extensionTable() {
    BlockFieldTable table = applicationTable();
    table.kind  = RecordKind::Driver;
    table.idKey = "Bundle ID";
    return table;
}

std::string MacOsCollector::osVersionFromSoftwareSection(const std::string& body) {
    const BlockParser parser(BlockLayout::Indented, std::string(kSource) + "/Software");
    for (const auto& block : parser.splitBlocks(body)) {
        std::string version = block.value("System Version");
        if (version.empty())
            continue;
        for (const char* prefix : {"macOS ", "Mac OS X ", "OS X "}) {
            if (startsWith(version, prefix)) {
                version = version.substr(std::string(prefix).size());
                break;
            }
        }
        return version;
    }
    return {};
}

InventoryResult MacOsCollector::collect() {
    logInfo("collecting applications and kernel extensions, please wait ...");

    std::string text;
    try {
        text = decodeText(profiler->fetch(), profiler->describe());
    } catch (const SourceUnavailable& ex) {
        throw CollectionFailed(std::string("system_profiler report unavailable: ") + ex.what());
    } catch (const MalformedSource& ex) {
        throw CollectionFailed(std::string("system_profiler report unreadable: ") + ex.what());
    }

    const auto sections = BlockParser::splitSections(text);
    if (!findSection(sections, "Software") &&
        !findSection(sections, "Applications") &&
        !findSection(sections, "Extensions")) {
        throw CollectionFailed("system_profiler report has no Software, Applications "
                               "or Extensions section");
    }

    InventoryResult result;

    std::string osVersion;
    if (const TextSection* software = findSection(sections, "Software"))
        osVersion = osVersionFromSoftwareSection(software->body);
    if (osVersion.empty())
        result.diagnostics.push_back({kSource, "Software", "no System Version in report"});

    result.records.emplace_back(RecordKind::OS, "macOS", "macOS", osVersion, "/",
                                epochSentinel(),
                                std::vector<std::string>{
                                    "Apple Code Signing Certification Authority",
                                    "Apple Root CA"});

    collectSection(sections, "Applications", applicationTable(), result);
    collectSection(sections, "Extensions", extensionTable(), result);

    return result;
}
