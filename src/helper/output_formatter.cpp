#include "output_formatter.h"

#include "json_exporter.h"
#include "text_utils.h"

#include <sstream>
#include <utility>

namespace {

// Kinds in order of first appearance, each with its records in input order.
std::vector<std::pair<std::string, std::vector<const SoftwareRecord*>>>
groupByKind(const std::vector<SoftwareRecord>& records) {
    std::vector<std::pair<std::string, std::vector<const SoftwareRecord*>>> groups;
    for (const auto& record : records) {
        auto it = groups.begin();
        for (; it != groups.end(); ++it) {
            if (it->first == record.kind()) break;
        }
        if (it == groups.end()) {
            groups.emplace_back(record.kind(), std::vector<const SoftwareRecord*>{});
            it = groups.end() - 1;
        }
        it->second.push_back(&record);
    }
    return groups;
}

std::string formatSummary(const std::vector<SoftwareRecord>& records) {
    std::ostringstream out;
    bool first = true;
    for (const auto& group : groupByKind(records)) {
        if (!first) out << '\n';
        first = false;

        out << '[' << group.first << "]\n";
        for (const SoftwareRecord* record : group.second) {
            out << "  " << record->name();
            if (!record->version().empty()) out << ' ' << record->version();
            out << '\n';
        }
    }
    return out.str();
}

}  // namespace

bool parseOutputMode(const std::string& text, OutputMode& out) {
    const std::string value = toLower(trim(text));
    if (value == "text" || value == "summary") {
        out = OutputMode::Summary;
        return true;
    }
    if (value == "json" || value == "structured") {
        out = OutputMode::Structured;
        return true;
    }
    return false;
}

std::string formatInventory(const std::vector<SoftwareRecord>& records, OutputMode mode) {
    if (mode == OutputMode::Structured) {
        const JsonExporter exporter;
        return exporter.exportToString(records);
    }
    return formatSummary(records);
}
