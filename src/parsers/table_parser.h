#pragma once

#include "../software_entry.h"

#include <string>
#include <vector>

// Header names that feed each record field. Positions are looked up in
// the header on every parse; tools reorder columns between releases.
struct TableColumnMap {
    const char* kind = RecordKind::Driver;
    std::string idColumn;
    std::string nameColumn;
    std::string versionColumn;
    std::string pathColumn;
    std::string modifiedColumn;
    std::string publisherColumn;
};

// Comma-separated table with a header row, as written by
// `driverquery /v /FO CSV`.
class TableParser {
public:
    explicit TableParser(std::string sourceName);

    // One ParseResult per data row. Throws MalformedSource when raw is
    // empty, not decodable, or its header names neither the id nor the
    // name column.
    std::vector<ParseResult> parse(const std::string& raw, const TableColumnMap& columns) const;

    // Splits one CSV line. Handles quoted fields and "" escapes.
    static std::vector<std::string> splitRow(const std::string& line);

private:
    std::string sourceName;
};
