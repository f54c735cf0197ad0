#pragma once

#include "../software_entry.h"

#include <string>
#include <vector>

// Reads the document written by JsonExporter back into records.
// Throws MalformedSource when the text is not such a document.
class JsonImporter {
public:
    std::vector<SoftwareRecord> importFromString(const std::string& json) const;
    std::vector<SoftwareRecord> importFromFile(const std::string& path) const;
};
