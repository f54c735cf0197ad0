#include "table_parser.h"

#include "../errors.h"
#include "../helper/logger.h"
#include "../helper/text_utils.h"
#include "../helper/time_utils.h"

#include <cstddef>
#include <utility>

namespace {

constexpr std::size_t kMissing = static_cast<std::size_t>(-1);

std::size_t columnIndex(const std::vector<std::string>& header, const std::string& name) {
    if (name.empty())
        return kMissing;
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (iequals(header[i], name))
            return i;
    }
    return kMissing;
}

std::string cell(const std::vector<std::string>& row, std::size_t index) {
    return index < row.size() ? trim(row[index]) : std::string();
}

}  // namespace

TableParser::TableParser(std::string sourceName)
    : sourceName(std::move(sourceName)) {}

std::vector<std::string> TableParser::splitRow(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

std::vector<ParseResult> TableParser::parse(const std::string& raw,
                                            const TableColumnMap& columns) const {
    const std::string text = decodeText(raw, sourceName);
    const auto lines = splitLines(text);

    std::size_t lineNo = 0;
    while (lineNo < lines.size() && trim(lines[lineNo]).empty())
        ++lineNo;

    std::vector<std::string> header = splitRow(lines[lineNo]);
    for (auto& name : header)
        name = trim(name);

    const std::size_t idCol       = columnIndex(header, columns.idColumn);
    const std::size_t nameCol     = columnIndex(header, columns.nameColumn);
    const std::size_t versionCol  = columnIndex(header, columns.versionColumn);
    const std::size_t pathCol     = columnIndex(header, columns.pathColumn);
    const std::size_t modifiedCol = columnIndex(header, columns.modifiedColumn);
    const std::size_t publisherCol = columnIndex(header, columns.publisherColumn);

    if (idCol == kMissing && nameCol == kMissing) {
        throw MalformedSource(sourceName + ": header has neither '" + columns.idColumn +
                              "' nor '" + columns.nameColumn + "' column");
    }

    std::vector<ParseResult> results;
    for (++lineNo; lineNo < lines.size(); ++lineNo) {
        if (trim(lines[lineNo]).empty())
            continue;

        const std::string where = "line " + std::to_string(lineNo + 1);
        const auto row = splitRow(lines[lineNo]);

        if (row.size() < header.size()) {
            results.push_back(ParseDiagnostic{
                sourceName, where,
                "row has " + std::to_string(row.size()) + " fields, header has " +
                    std::to_string(header.size())});
            continue;
        }

        std::string id = cell(row, idCol);
        std::string name = cell(row, nameCol);
        if (id.empty() && name.empty()) {
            results.push_back(ParseDiagnostic{sourceName, where,
                                              "row has neither a name nor an identifier"});
            continue;
        }

        Timestamp modified = epochSentinel();
        const std::string rawModified = cell(row, modifiedCol);
        if (!rawModified.empty() &&
            !parseTimestampAny(rawModified,
                               {"%m/%d/%Y %I:%M:%S %p", "%d.%m.%Y %H:%M:%S",
                                "%Y-%m-%dT%H:%M:%SZ", "%Y-%m-%d %H:%M:%S"},
                               modified)) {
            logDebug(sourceName + ": unrecognized date '" + rawModified + "' at " + where);
            modified = epochSentinel();
        }

        std::vector<std::string> publishers;
        std::string publisher = cell(row, publisherCol);
        if (!publisher.empty())
            publishers.push_back(std::move(publisher));

        results.push_back(SoftwareRecord(columns.kind,
                                         std::move(name),
                                         std::move(id),
                                         cell(row, versionCol),
                                         cell(row, pathCol),
                                         modified,
                                         std::move(publishers)));
    }
    return results;
}
