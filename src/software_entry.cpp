#include "software_entry.h"

#include <stdexcept>
#include <utility>

SoftwareRecord::SoftwareRecord(std::string kind,
                               std::string name,
                               std::string id,
                               std::string version,
                               std::string path,
                               Timestamp modified,
                               std::vector<std::string> publishers)
    : recordKind(std::move(kind)),
      displayName(std::move(name)),
      identifier(std::move(id)),
      versionString(std::move(version)),
      installPath(std::move(path)),
      modifiedAt(modified),
      publisherChain(std::move(publishers))
{
    if (recordKind.empty())
        throw std::invalid_argument("record kind must not be empty");
    if (displayName.empty() && identifier.empty())
        throw std::invalid_argument("record needs a name or an id");

    if (displayName.empty())
        displayName = identifier;
    if (identifier.empty())
        identifier = displayName;
}

bool SoftwareRecord::operator==(const SoftwareRecord& other) const {
    return recordKind == other.recordKind &&
           displayName == other.displayName &&
           identifier == other.identifier &&
           versionString == other.versionString &&
           installPath == other.installPath &&
           modifiedAt == other.modifiedAt &&
           publisherChain == other.publisherChain;
}

void appendResults(std::vector<ParseResult>&& results, InventoryResult& into) {
    for (auto& result : results) {
        if (auto* record = std::get_if<SoftwareRecord>(&result))
            into.records.push_back(std::move(*record));
        else
            into.diagnostics.push_back(std::move(std::get<ParseDiagnostic>(result)));
    }
}

std::string describeDiagnostic(const ParseDiagnostic& diagnostic) {
    std::string out = diagnostic.source;
    if (!diagnostic.location.empty())
        out += " (" + diagnostic.location + ")";
    out += ": " + diagnostic.message;
    return out;
}
