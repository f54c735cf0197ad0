#include "json_exporter.h"

#include "time_utils.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

// Handles control chars and embedded NUL that appear in real registry
// values and tool output on some systems.
std::string escapeJson(const std::string& input) {
    std::string output;
    output.reserve(input.size() + 8);
    for (const unsigned char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            case '\0': break;  // drop embedded NUL
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", unsigned(c));
                    output += buf;
                } else {
                    output += char(c);
                }
        }
    }
    return output;
}

void writeRecords(std::ostream& out, const std::vector<SoftwareRecord>& records) {
    if (records.empty()) {
        out << "[]\n";
        return;
    }

    out << "[\n";
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        out << "  {\n";
        out << "    \"kind\": \""     << escapeJson(r.kind())              << "\",\n";
        out << "    \"name\": \""     << escapeJson(r.name())              << "\",\n";
        out << "    \"id\": \""       << escapeJson(r.id())                << "\",\n";
        out << "    \"version\": \""  << escapeJson(r.version())           << "\",\n";
        out << "    \"path\": \""     << escapeJson(r.path())              << "\",\n";
        out << "    \"modified\": \"" << formatIso8601(r.modified())       << "\",\n";

        const auto& publishers = r.publishers();
        if (publishers.empty()) {
            out << "    \"publishers\": []\n";
        } else {
            out << "    \"publishers\": [\n";
            for (size_t p = 0; p < publishers.size(); ++p) {
                out << "      \"" << escapeJson(publishers[p]) << "\"";
                if (p + 1 < publishers.size()) out << ",";
                out << "\n";
            }
            out << "    ]\n";
        }

        out << "  }";
        if (i + 1 < records.size()) out << ",";
        out << "\n";
    }
    out << "]\n";
}

}  // namespace

std::string JsonExporter::exportToString(const std::vector<SoftwareRecord>& records) const {
    std::ostringstream out;
    writeRecords(out, records);
    return out.str();
}

void JsonExporter::exportToFile(const std::vector<SoftwareRecord>& records,
                                const std::string& outputPath) const
{
    std::ofstream out(outputPath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open())
        throw std::runtime_error("Unable to open output file: " + outputPath);

    writeRecords(out, records);
    if (!out)
        throw std::runtime_error("Unable to write output file: " + outputPath);
}
