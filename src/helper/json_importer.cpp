#include "json_importer.h"

#include "time_utils.h"
#include "../errors.h"
#include "../sources/file_source.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace {

using json = nlohmann::json;

std::string requireString(const json& object, const char* field, std::size_t index) {
    auto it = object.find(field);
    if (it == object.end() || !it->is_string()) {
        throw MalformedSource("inventory record " + std::to_string(index) +
                              ": missing string field '" + field + "'");
    }
    return it->get<std::string>();
}

SoftwareRecord recordFromJson(const json& object, std::size_t index) {
    if (!object.is_object())
        throw MalformedSource("inventory record " + std::to_string(index) + " is not an object");

    const std::string modifiedText = requireString(object, "modified", index);
    Timestamp modified;
    if (!parseTimestamp(modifiedText, "%Y-%m-%dT%H:%M:%SZ", modified)) {
        throw MalformedSource("inventory record " + std::to_string(index) +
                              ": bad timestamp '" + modifiedText + "'");
    }

    auto publishersIt = object.find("publishers");
    if (publishersIt == object.end() || !publishersIt->is_array()) {
        throw MalformedSource("inventory record " + std::to_string(index) +
                              ": missing array field 'publishers'");
    }
    std::vector<std::string> publishers;
    for (const auto& publisher : *publishersIt) {
        if (!publisher.is_string()) {
            throw MalformedSource("inventory record " + std::to_string(index) +
                                  ": publishers must be strings");
        }
        publishers.push_back(publisher.get<std::string>());
    }

    try {
        return SoftwareRecord(requireString(object, "kind", index),
                              requireString(object, "name", index),
                              requireString(object, "id", index),
                              requireString(object, "version", index),
                              requireString(object, "path", index),
                              modified,
                              std::move(publishers));
    } catch (const std::invalid_argument& ex) {
        throw MalformedSource("inventory record " + std::to_string(index) + ": " + ex.what());
    }
}

}  // namespace

std::vector<SoftwareRecord> JsonImporter::importFromString(const std::string& text) const {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw MalformedSource(std::string("inventory document is not valid JSON: ") + ex.what());
    }

    if (!document.is_array())
        throw MalformedSource("inventory document must be a JSON array");

    std::vector<SoftwareRecord> records;
    records.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i)
        records.push_back(recordFromJson(document[i], i));
    return records;
}

std::vector<SoftwareRecord> JsonImporter::importFromFile(const std::string& path) const {
    FileSource source(path);
    return importFromString(source.fetch());
}
