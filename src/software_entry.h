#pragma once

#include <chrono>
#include <string>
#include <variant>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

// Kind tags written into SoftwareRecord::kind. The set is open: collectors
// may emit any other non-empty tag and consumers must carry it through.
namespace RecordKind {
    constexpr const char* OS          = "OS";
    constexpr const char* Application = "Application";
    constexpr const char* Driver      = "Driver";
    constexpr const char* Package     = "Package";
}

// One normalized inventory item. Immutable once constructed.
//   name      → falls back to id when the source has no display name
//   modified  → epoch when the source has no reliable timestamp
//   publishers→ outermost signer first, root CA last, source order
class SoftwareRecord {
public:
    SoftwareRecord(std::string kind,
                   std::string name,
                   std::string id,
                   std::string version,
                   std::string path,
                   Timestamp modified,
                   std::vector<std::string> publishers);

    const std::string& kind() const { return recordKind; }
    const std::string& name() const { return displayName; }
    const std::string& id() const { return identifier; }
    const std::string& version() const { return versionString; }
    const std::string& path() const { return installPath; }
    Timestamp modified() const { return modifiedAt; }
    const std::vector<std::string>& publishers() const { return publisherChain; }

    bool operator==(const SoftwareRecord& other) const;
    bool operator!=(const SoftwareRecord& other) const { return !(*this == other); }

private:
    std::string recordKind;
    std::string displayName;
    std::string identifier;
    std::string versionString;
    std::string installPath;
    Timestamp modifiedAt;
    std::vector<std::string> publisherChain;
};

struct ParseDiagnostic {
    std::string source;    // e.g. "system_profiler/Applications", "driverquery"
    std::string location;  // block, line or registry key reference
    std::string message;
};

using ParseResult = std::variant<SoftwareRecord, ParseDiagnostic>;

struct InventoryResult {
    std::vector<SoftwareRecord> records;
    std::vector<ParseDiagnostic> diagnostics;
};

// Moves every parse result into the matching list of `into`, keeping order.
void appendResults(std::vector<ParseResult>&& results, InventoryResult& into);

std::string describeDiagnostic(const ParseDiagnostic& diagnostic);
