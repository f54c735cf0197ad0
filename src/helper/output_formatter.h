#pragma once

#include "../software_entry.h"

#include <string>
#include <vector>

enum class OutputMode {
    Summary,     // human-readable listing grouped by kind
    Structured   // JSON document, see JsonExporter
};

bool parseOutputMode(const std::string& text, OutputMode& out);

std::string formatInventory(const std::vector<SoftwareRecord>& records, OutputMode mode);
