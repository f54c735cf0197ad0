#pragma once

// ════════════════════════════════════════════════════════════════
//  block_parser.h
//
//  Parses repeated key/value blocks into SoftwareRecords.
//
//  Two layouts are understood:
//    Indented → system_profiler text output
//
//                 Applications:
//
//                     Google Drive:
//
//                       Version: 62.0
//                       Signed by: Developer ID Application: ...
//                           Apple Root CA
//
//               unindented "Name:" lines are sections (splitSections),
//               the shallowest lines of a section body open blocks,
//               deeper lines are fields, lines deeper than the field
//               indent continue the previous field.
//    Stanza   → deb822 / dpkg database: blank-line separated blocks,
//               "Key: Value" in column 0, whitespace-led lines continue
//               the previous field.
//
//  Which keys feed which record field is decided by a BlockFieldTable,
//  so the parser itself knows nothing about the operating system.
// ════════════════════════════════════════════════════════════════

#include "../software_entry.h"

#include <cstddef>
#include <string>
#include <vector>

enum class BlockLayout {
    Indented,
    Stanza
};

struct BlockField {
    std::string key;
    std::vector<std::string> values;  // one per line, encounter order
};

struct TextBlock {
    std::string title;   // Indented layout only; empty when untitled
    std::size_t line = 0;  // 1-based line of the block's first line
    std::vector<BlockField> fields;

    // Case-insensitive lookup; nullptr when absent.
    const BlockField* find(const std::string& key) const;
    // First non-empty value of key, or "".
    std::string value(const std::string& key) const;
};

struct TextSection {
    std::string name;
    std::size_t line = 0;  // 1-based line of the section header
    std::string body;
};

struct BlockFieldTable {
    const char* kind = RecordKind::Application;
    std::string nameKey;        // empty → block title
    std::string idKey;          // empty or absent → name
    std::string versionKey;
    std::string pathKey;
    std::string modifiedKey;
    std::string publishersKey;
    std::string listSeparator;  // splits a single publishers line; empty → no split.
                                // Items starting lower-case, with '(' or with a legal
                                // form ("Inc.", "LLC") rejoin the previous signer.
    std::string requiredKey;    // blocks whose requiredKey != requiredValue are skipped
    std::string requiredValue;
};

class BlockParser {
public:
    BlockParser(BlockLayout layout, std::string sourceName);

    // One ParseResult per block, in input order. Throws MalformedSource
    // when raw is empty or not decodable text.
    std::vector<ParseResult> parse(const std::string& raw, const BlockFieldTable& table) const;

    std::vector<TextBlock> splitBlocks(const std::string& text) const;

    // Indented layout: unindented lines ending in ':' and their bodies.
    static std::vector<TextSection> splitSections(const std::string& text);

private:
    std::vector<TextBlock> splitIndented(const std::vector<std::string>& lines) const;
    std::vector<TextBlock> splitStanzas(const std::vector<std::string>& lines) const;

    ParseResult toRecord(const TextBlock& block, const BlockFieldTable& table) const;

    BlockLayout layout;
    std::string sourceName;
};
