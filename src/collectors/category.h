#pragma once

#include "../errors.h"
#include "../helper/logger.h"
#include "../software_entry.h"
#include "../sources/iraw_source.h"

#include <string>
#include <utility>
#include <vector>

// Fetches one category from its raw source and hands the bytes to parse.
// A source that cannot be fetched or whose output is not in the expected
// format becomes a single diagnostic for that category.
// Returns false when the category contributed nothing because of that.
template <typename ParseFn>
bool collectCategory(const std::string& category,
                     IRawSource& source,
                     ParseFn parse,
                     InventoryResult& into)
{
    try {
        const std::string raw = source.fetch();
        std::vector<ParseResult> results = parse(raw);
        appendResults(std::move(results), into);
        return true;
    } catch (const SourceUnavailable& ex) {
        into.diagnostics.push_back({source.describe(), category, ex.what()});
    } catch (const MalformedSource& ex) {
        into.diagnostics.push_back({source.describe(), category, ex.what()});
    }
    logDebug(category + ": no records collected from " + source.describe());
    return false;
}
