#include "registry_tree_parser.h"

#include "../errors.h"
#include "../helper/logger.h"
#include "../helper/text_utils.h"
#include "../helper/time_utils.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <utility>

namespace {

struct LogicalLine {
    std::string text;
    std::size_t line = 0;
};

// Joins lines continued with a trailing backslash (long hex values).
std::vector<LogicalLine> joinContinuations(const std::vector<std::string>& lines) {
    std::vector<LogicalLine> out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        LogicalLine logical;
        logical.line = i + 1;
        std::string text = trim(lines[i]);
        while (!text.empty() && text.back() == '\\' && i + 1 < lines.size()) {
            text.pop_back();
            text += trim(lines[++i]);
        }
        logical.text = std::move(text);
        out.push_back(std::move(logical));
    }
    return out;
}

// Reads a quoted string starting at text[pos] == '"'. Handles \\ and \".
bool readQuoted(const std::string& text, std::size_t& pos, std::string& out) {
    if (pos >= text.size() || text[pos] != '"')
        return false;
    out.clear();
    for (++pos; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c == '\\' && pos + 1 < text.size()) {
            out += text[++pos];
        } else if (c == '"') {
            ++pos;
            return true;
        } else {
            out += c;
        }
    }
    return false;
}

bool parseHexBytes(const std::string& text, std::string& bytes) {
    bytes.clear();
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && (text[pos] == ',' || std::isspace(static_cast<unsigned char>(text[pos]))))
            ++pos;
        if (pos >= text.size())
            break;
        if (pos + 1 >= text.size() ||
            !std::isxdigit(static_cast<unsigned char>(text[pos])) ||
            !std::isxdigit(static_cast<unsigned char>(text[pos + 1])))
            return false;
        bytes += static_cast<char>(std::stoi(text.substr(pos, 2), nullptr, 16));
        pos += 2;
    }
    return true;
}

std::string stripTrailingNuls(std::string s) {
    while (!s.empty() && s.back() == '\0')
        s.pop_back();
    return s;
}

enum class ValueParse { Ok, Ignored, Invalid };

// Decodes the data part of a value line ("..." | dword: | hex(x):).
ValueParse parseValueData(const std::string& data, std::string& out) {
    if (!data.empty() && data[0] == '"') {
        std::size_t pos = 0;
        if (!readQuoted(data, pos, out) || !trim(data.substr(pos)).empty())
            return ValueParse::Invalid;
        return ValueParse::Ok;
    }

    if (startsWith(data, "dword:")) {
        const std::string hex = trim(data.substr(6));
        if (hex.empty() || hex.size() > 8 ||
            !std::all_of(hex.begin(), hex.end(),
                         [](unsigned char c) { return std::isxdigit(c) != 0; }))
            return ValueParse::Invalid;
        out = std::to_string(std::stoul(hex, nullptr, 16));
        return ValueParse::Ok;
    }

    if (data == "-")
        return ValueParse::Ignored;

    if (!startsWith(data, "hex"))
        return ValueParse::Invalid;

    const auto colon = data.find(':');
    if (colon == std::string::npos)
        return ValueParse::Invalid;
    const std::string type = data.substr(0, colon);

    std::string bytes;
    if (!parseHexBytes(data.substr(colon + 1), bytes))
        return ValueParse::Invalid;

    if (type == "hex(b)") {
        if (bytes.size() != 8)
            return ValueParse::Invalid;
        std::uint64_t v = 0;
        for (std::size_t i = 8; i-- > 0;)
            v = (v << 8) | static_cast<unsigned char>(bytes[i]);
        out = std::to_string(v);
        return ValueParse::Ok;
    }

    if (type == "hex(2)" || type == "hex(7)") {
        std::string decoded;
        if (!utf16LeToUtf8(bytes, decoded))
            return ValueParse::Invalid;
        decoded = stripTrailingNuls(std::move(decoded));
        if (type == "hex(7)")
            std::replace(decoded.begin(), decoded.end(), '\0', '\n');
        out = std::move(decoded);
        return ValueParse::Ok;
    }

    // REG_BINARY and other raw types carry nothing the record needs.
    return ValueParse::Ignored;
}

std::string parentPath(const std::string& path) {
    const auto sep = path.rfind('\\');
    return sep == std::string::npos ? std::string() : path.substr(0, sep);
}

std::string leafName(const std::string& path) {
    const auto sep = path.rfind('\\');
    return sep == std::string::npos ? path : path.substr(sep + 1);
}

// "; LastWriteTime=2023-01-15T10:42:07Z" inside a key; other comments are
// ignored.
void readLastWriteComment(const std::string& line, RegistryKeyNode& key) {
    const std::string body = trim(line.substr(1));
    const std::string prefix = std::string(kLastWriteTimeTag) + "=";
    if (startsWith(body, prefix))
        key.lastWriteTime = trim(body.substr(prefix.size()));
}

std::string firstNonEmpty(const RegistryKeyNode& key, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        std::string v = RegistryTree::value(key, name);
        if (!v.empty())
            return v;
    }
    return {};
}

}  // namespace

std::string RegistryTree::value(const RegistryKeyNode& key, const std::string& name) {
    auto it = key.values.find(toLower(name));
    return it != key.values.end() ? it->second : "";
}

RegistryTreeParser::RegistryTreeParser(std::string sourceName)
    : sourceName(std::move(sourceName)) {}

RegistryTree RegistryTreeParser::buildTree(const std::string& text,
                                           std::vector<ParseDiagnostic>& diagnostics) const {
    RegistryTree tree;
    std::map<std::string, std::size_t> byPath;  // lower-cased path → index
    const std::size_t kNone = static_cast<std::size_t>(-1);
    std::size_t current = kNone;
    bool skippingKey = false;

    for (const auto& logical : joinContinuations(splitLines(text))) {
        const std::string& line = logical.text;
        if (line.empty())
            continue;
        if (line[0] == ';') {
            if (current != kNone)
                readLastWriteComment(line, tree.keys[current]);
            continue;
        }
        if (startsWith(line, "Windows Registry Editor") || line == "REGEDIT4")
            continue;

        const std::string where = "line " + std::to_string(logical.line);

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                diagnostics.push_back({sourceName, where, "malformed key header"});
                current = kNone;
                skippingKey = true;
                continue;
            }
            const std::string path = line.substr(1, line.size() - 2);
            if (path[0] == '-') {
                current = kNone;
                skippingKey = true;
                continue;
            }
            skippingKey = false;

            const std::string lowered = toLower(path);
            auto it = byPath.find(lowered);
            if (it != byPath.end()) {
                current = it->second;
            } else {
                RegistryKeyNode node;
                node.path = path;
                node.name = leafName(path);
                node.line = logical.line;
                current = tree.keys.size();
                byPath.emplace(lowered, current);
                tree.keys.push_back(std::move(node));
            }
            continue;
        }

        if (current == kNone) {
            if (!skippingKey)
                diagnostics.push_back({sourceName, where, "value outside of any key"});
            continue;
        }

        std::string name;
        std::size_t pos = 0;
        if (line[0] == '@') {
            pos = 1;
        } else if (!readQuoted(line, pos, name)) {
            diagnostics.push_back({sourceName, where, "unreadable value name"});
            continue;
        }

        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
            ++pos;
        if (pos >= line.size() || line[pos] != '=') {
            diagnostics.push_back({sourceName, where, "missing '=' after value name"});
            continue;
        }

        std::string data;
        switch (parseValueData(trim(line.substr(pos + 1)), data)) {
            case ValueParse::Ok:
                tree.keys[current].values[toLower(name)] = std::move(data);
                break;
            case ValueParse::Ignored:
                break;
            case ValueParse::Invalid:
                diagnostics.push_back({sourceName,
                                       where + " in " + tree.keys[current].path,
                                       "unreadable data for value '" + name + "'"});
                break;
        }
    }

    for (std::size_t i = 0; i < tree.keys.size(); ++i) {
        auto parent = byPath.find(toLower(parentPath(tree.keys[i].path)));
        if (parent != byPath.end() && parent->second != i)
            tree.keys[parent->second].children.push_back(i);
        else
            tree.roots.push_back(i);
    }
    return tree;
}

std::vector<ParseResult> RegistryTreeParser::parse(const std::string& raw) const {
    const std::string text = decodeText(raw, sourceName);

    std::vector<ParseDiagnostic> treeDiagnostics;
    const RegistryTree tree = buildTree(text, treeDiagnostics);
    if (tree.keys.empty())
        throw MalformedSource(sourceName + ": no registry keys in output");

    // (line, result) so diagnostics and records interleave in input order.
    std::vector<std::pair<std::size_t, ParseResult>> ordered;

    for (auto& diagnostic : treeDiagnostics) {
        std::size_t line = 0;
        if (startsWith(diagnostic.location, "line "))
            line = std::stoul(diagnostic.location.substr(5));
        ordered.emplace_back(line, std::move(diagnostic));
    }

    for (std::size_t root : tree.roots) {
        for (std::size_t child : tree.keys[root].children) {
            const RegistryKeyNode& key = tree.keys[child];

            std::string name = RegistryTree::value(key, "DisplayName");
            if (name.empty()) {
                logDebug(sourceName + ": skipping uninstall entry without DisplayName: " + key.path);
                continue;
            }

            Timestamp modified = epochSentinel();
            const std::string installDate = RegistryTree::value(key, "InstallDate");
            bool dated = false;
            if (!installDate.empty()) {
                dated = parseTimestamp(installDate, "%Y%m%d", modified);
                if (!dated)
                    logDebug(sourceName + ": unrecognized InstallDate '" + installDate +
                             "' in " + key.path);
            }
            if (!dated && !key.lastWriteTime.empty()) {
                dated = parseTimestamp(key.lastWriteTime, "%Y-%m-%dT%H:%M:%SZ", modified);
                if (!dated)
                    logDebug(sourceName + ": unrecognized " + kLastWriteTimeTag + " '" +
                             key.lastWriteTime + "' in " + key.path);
            }
            if (!dated)
                modified = epochSentinel();

            std::vector<std::string> publishers;
            std::string publisher = trim(RegistryTree::value(key, "Publisher"));
            if (!publisher.empty())
                publishers.push_back(std::move(publisher));

            ordered.emplace_back(
                key.line,
                SoftwareRecord(RecordKind::Application,
                               std::move(name),
                               key.name,
                               firstNonEmpty(key, {"DisplayVersion", "Version"}),
                               firstNonEmpty(key, {"InstallLocation", "InstallSource", "BundleCachePath"}),
                               modified,
                               std::move(publishers)));
        }
    }

    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<ParseResult> results;
    results.reserve(ordered.size());
    for (auto& entry : ordered)
        results.push_back(std::move(entry.second));
    return results;
}
