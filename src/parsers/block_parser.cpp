#include "block_parser.h"

#include "../helper/logger.h"
#include "../helper/text_utils.h"
#include "../helper/time_utils.h"

#include <cctype>
#include <limits>
#include <utility>

namespace {

constexpr std::size_t kNoIndent = std::numeric_limits<std::size_t>::max();

// "Key: Value" → (Key, Value). In the indented layout the separator is
// ": " or a trailing ':', since values routinely contain colons
// ("Developer ID Application: Google LLC"). deb822 keys never contain ':'.
bool splitKeyValue(const std::string& content, BlockLayout layout,
                   std::string& key, std::string& value) {
    if (layout == BlockLayout::Stanza) {
        const auto colon = content.find(':');
        if (colon == std::string::npos || colon == 0)
            return false;
        key = trim(content.substr(0, colon));
        value = trim(content.substr(colon + 1));
        return !key.empty();
    }

    const auto sep = content.find(": ");
    if (sep != std::string::npos && sep > 0) {
        key = trim(content.substr(0, sep));
        value = trim(content.substr(sep + 2));
        return !key.empty();
    }
    if (content.size() > 1 && content.back() == ':') {
        key = trim(content.substr(0, content.size() - 1));
        value.clear();
        return !key.empty();
    }
    return false;
}

void addField(TextBlock& block, const std::string& key, const std::string& value) {
    for (auto& field : block.fields) {
        if (iequals(field.key, key)) {
            if (!value.empty())
                field.values.push_back(value);
            return;
        }
    }
    BlockField field;
    field.key = key;
    if (!value.empty())
        field.values.push_back(value);
    block.fields.push_back(std::move(field));
}

void addContinuation(TextBlock& block, const std::string& value) {
    if (block.fields.empty() || value.empty())
        return;
    block.fields.back().values.push_back(value);
}

// Legal-form words that follow a comma inside one organization name.
bool isCorporateSuffix(std::string word) {
    static const char* const kSuffixes[] = {
        "inc", "llc", "l.l.c", "ltd", "limited", "gmbh", "corp", "corporation",
        "co", "s.a", "ag", "b.v", "n.v", "plc", "llp", "pty", "s.r.l"
    };
    while (!word.empty() && (word.back() == '.' || word.back() == ','))
        word.pop_back();
    word = toLower(word);
    for (const char* suffix : kSuffixes) {
        if (word == suffix)
            return true;
    }
    return false;
}

// True when a list item cannot open a new signer name and so belongs to the
// previous one ("Inc. (BJ4HAAB9B3)", "(EQHXZ8M8AV)", "a division of ...").
bool continuesPreviousItem(const std::string& item) {
    if (item.empty())
        return false;
    const unsigned char first = static_cast<unsigned char>(item[0]);
    if (std::islower(first) || first == '(')
        return true;
    return isCorporateSuffix(item.substr(0, item.find_first_of(" (")));
}

// Splits a one-line signer chain, keeping names with embedded separators
// ("Zoom Video Communications, Inc.") in one piece.
std::vector<std::string> splitSignerList(const std::string& line, const std::string& separator) {
    std::vector<std::string> signers;
    for (auto& item : splitList(line, separator)) {
        if (!signers.empty() && continuesPreviousItem(item))
            signers.back() += separator + item;
        else
            signers.push_back(std::move(item));
    }
    return signers;
}

std::string blockLocation(const TextBlock& block, std::size_t index) {
    std::string where = "block " + std::to_string(index + 1);
    if (!block.title.empty())
        where += " '" + block.title + "'";
    return where + " at line " + std::to_string(block.line);
}

}  // namespace

const BlockField* TextBlock::find(const std::string& key) const {
    if (key.empty())
        return nullptr;
    for (const auto& field : fields) {
        if (iequals(field.key, key))
            return &field;
    }
    return nullptr;
}

std::string TextBlock::value(const std::string& key) const {
    const BlockField* field = find(key);
    if (!field)
        return {};
    for (const auto& v : field->values) {
        if (!v.empty())
            return v;
    }
    return {};
}

BlockParser::BlockParser(BlockLayout layout, std::string sourceName)
    : layout(layout), sourceName(std::move(sourceName)) {}

std::vector<TextSection> BlockParser::splitSections(const std::string& text) {
    std::vector<TextSection> sections;
    const auto lines = splitLines(text);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const std::string content = trim(line);
        if (content.empty())
            continue;

        if (leadingIndent(line) == 0 && content.size() > 1 && content.back() == ':') {
            TextSection section;
            section.name = trim(content.substr(0, content.size() - 1));
            section.line = i + 1;
            sections.push_back(std::move(section));
            continue;
        }

        // Indented content before the first section header has no owner.
        if (!sections.empty()) {
            sections.back().body += line;
            sections.back().body += '\n';
        }
    }
    return sections;
}

std::vector<TextBlock> BlockParser::splitBlocks(const std::string& text) const {
    const auto lines = splitLines(text);
    return layout == BlockLayout::Indented ? splitIndented(lines) : splitStanzas(lines);
}

std::vector<TextBlock> BlockParser::splitIndented(const std::vector<std::string>& lines) const {
    std::vector<TextBlock> blocks;
    std::size_t boundaryIndent = kNoIndent;
    std::size_t fieldIndent = kNoIndent;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string content = trim(lines[i]);
        if (content.empty())
            continue;

        const std::size_t indent = leadingIndent(lines[i]);
        if (boundaryIndent == kNoIndent)
            boundaryIndent = indent;

        std::string key;
        std::string value;

        if (indent <= boundaryIndent) {
            TextBlock block;
            block.line = i + 1;
            if (content.back() == ':')
                block.title = trim(content.substr(0, content.size() - 1));
            else if (splitKeyValue(content, layout, key, value))
                addField(block, key, value);
            blocks.push_back(std::move(block));
            fieldIndent = kNoIndent;
            continue;
        }

        TextBlock& current = blocks.back();
        if (fieldIndent == kNoIndent || indent <= fieldIndent) {
            if (fieldIndent == kNoIndent)
                fieldIndent = indent;
            if (splitKeyValue(content, layout, key, value))
                addField(current, key, value);
            else
                addContinuation(current, content);
        } else {
            addContinuation(current, content);
        }
    }
    return blocks;
}

std::vector<TextBlock> BlockParser::splitStanzas(const std::vector<std::string>& lines) const {
    std::vector<TextBlock> blocks;
    bool open = false;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const std::string content = trim(line);
        if (content.empty()) {
            open = false;
            continue;
        }

        if (line[0] == ' ' || line[0] == '\t') {
            if (open)
                addContinuation(blocks.back(), content == "." ? std::string() : content);
            continue;
        }

        if (!open) {
            TextBlock block;
            block.line = i + 1;
            blocks.push_back(std::move(block));
            open = true;
        }

        std::string key;
        std::string value;
        if (splitKeyValue(content, layout, key, value))
            addField(blocks.back(), key, value);
    }
    return blocks;
}

ParseResult BlockParser::toRecord(const TextBlock& block, const BlockFieldTable& table) const {
    std::string name = table.nameKey.empty() ? block.title : block.value(table.nameKey);
    std::string id = block.value(table.idKey);

    if (name.empty() && id.empty()) {
        return ParseDiagnostic{sourceName, {},
                               "block has neither a name nor an identifier"};
    }

    Timestamp modified = epochSentinel();
    const std::string rawModified = block.value(table.modifiedKey);
    if (!rawModified.empty() &&
        !parseTimestampAny(rawModified,
                           {"%Y-%m-%dT%H:%M:%SZ", "%Y-%m-%d %H:%M:%S",
                            "%m/%d/%y, %I:%M %p", "%m/%d/%Y, %I:%M %p"},
                           modified)) {
        logDebug(sourceName + ": unrecognized timestamp '" + rawModified +
                 "' for '" + (name.empty() ? id : name) + "'");
        modified = epochSentinel();
    }

    std::vector<std::string> publishers;
    if (const BlockField* signers = block.find(table.publishersKey)) {
        for (const auto& line : signers->values) {
            for (auto& item : splitSignerList(line, table.listSeparator))
                publishers.push_back(std::move(item));
        }
    }

    return SoftwareRecord(table.kind,
                          std::move(name),
                          std::move(id),
                          block.value(table.versionKey),
                          block.value(table.pathKey),
                          modified,
                          std::move(publishers));
}

std::vector<ParseResult> BlockParser::parse(const std::string& raw,
                                            const BlockFieldTable& table) const {
    const std::string text = decodeText(raw, sourceName);
    const auto blocks = splitBlocks(text);

    std::vector<ParseResult> results;
    results.reserve(blocks.size());

    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const TextBlock& block = blocks[i];

        if (!table.requiredKey.empty() &&
            !iequals(block.value(table.requiredKey), table.requiredValue)) {
            logDebug(sourceName + ": skipping " + blockLocation(block, i) +
                     ", " + table.requiredKey + " is not '" + table.requiredValue + "'");
            continue;
        }

        ParseResult result = toRecord(block, table);
        if (auto* diagnostic = std::get_if<ParseDiagnostic>(&result))
            diagnostic->location = blockLocation(block, i);
        results.push_back(std::move(result));
    }
    return results;
}
