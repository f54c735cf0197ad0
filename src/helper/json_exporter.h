#pragma once

#include "../software_entry.h"

#include <string>
#include <vector>

// Structured inventory document: a JSON array with one object per record.
// Every object carries all seven fields, empty or not:
//   kind, name, id, version, path, modified (ISO-8601 UTC), publishers
class JsonExporter {
public:
    std::string exportToString(const std::vector<SoftwareRecord>& records) const;

    // Throws std::runtime_error when the file cannot be written.
    void exportToFile(const std::vector<SoftwareRecord>& records,
                      const std::string& outputPath) const;
};
