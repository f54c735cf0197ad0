#pragma once

// ════════════════════════════════════════════════════════════════
//  registry_tree_parser.h
//
//  Parses registry export text (the format written by `reg export`
//  and regedit, also produced by RegistryExportSource) into a key
//  tree and turns every direct subkey of an exported root into one
//  Application record.
//
//  Value names read per subkey:
//    DisplayName                               → name (required)
//    DisplayVersion, Version                   → version
//    InstallLocation, InstallSource,
//    BundleCachePath                           → path (first non-empty)
//    Publisher                                 → publishers[0]
//    InstallDate (YYYYMMDD)                    → modified
//    "; LastWriteTime=<ISO-8601>" comment      → modified when no
//                                                InstallDate
//
//  The LastWriteTime comment is written by RegistryExportSource right
//  after a key header; `reg export` never writes it and regedit treats
//  it as an ordinary comment.
//
//  Subkeys without DisplayName are uninstall leftovers and are skipped
//  without a diagnostic.
// ════════════════════════════════════════════════════════════════

#include "../software_entry.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Comment tag carrying a key's last-write time in registry export text.
constexpr const char* kLastWriteTimeTag = "LastWriteTime";

struct RegistryKeyNode {
    std::string path;                           // full path as written in the export
    std::string name;                           // last path component
    std::size_t line = 0;
    std::map<std::string, std::string> values;  // lower-cased value name → data
    std::string lastWriteTime;                  // ISO-8601 from the comment, or ""
    std::vector<std::size_t> children;          // indexes into RegistryTree::keys
};

struct RegistryTree {
    std::vector<RegistryKeyNode> keys;  // encounter order
    std::vector<std::size_t> roots;     // keys whose parent is not exported

    // Case-insensitive value lookup; "" when absent.
    static std::string value(const RegistryKeyNode& key, const std::string& name);
};

class RegistryTreeParser {
public:
    explicit RegistryTreeParser(std::string sourceName = "registry");

    // Throws MalformedSource when raw is empty, not decodable, or has no
    // key header at all.
    std::vector<ParseResult> parse(const std::string& raw) const;

    // Builds the key tree; unparseable value lines are reported through
    // diagnostics and skipped.
    RegistryTree buildTree(const std::string& text,
                           std::vector<ParseDiagnostic>& diagnostics) const;

private:
    std::string sourceName;
};
