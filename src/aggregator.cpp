#include "aggregator.h"

#include "errors.h"
#include "helper/logger.h"
#include "helper/text_utils.h"

#include <map>
#include <utility>

InventoryResult Aggregator::run(IPlatformCollector& collector) const {
    logDebug("running " + collector.platformName() + " collector");

    InventoryResult collected = collector.collect();
    if (collected.records.empty()) {
        throw CollectionFailed(collector.platformName() +
                               " collector produced no records");
    }

    InventoryResult inventory = normalize(std::move(collected));
    logDebug("inventory holds " + std::to_string(inventory.records.size()) +
             " records and " + std::to_string(inventory.diagnostics.size()) +
             " diagnostics");
    return inventory;
}

InventoryResult Aggregator::normalize(InventoryResult collected) const {
    InventoryResult out;
    out.diagnostics = std::move(collected.diagnostics);
    out.records.reserve(collected.records.size());

    std::map<std::pair<std::string, std::string>, std::size_t> positions;

    for (auto& record : collected.records) {
        // The constructor rejects empty fields; whitespace-only ones still
        // reach here from sources that pad their output.
        if (trim(record.id()).empty() || trim(record.name()).empty()) {
            out.diagnostics.push_back({"aggregator", record.kind(),
                                       "record with a blank name or id discarded"});
            continue;
        }

        auto key = std::make_pair(record.kind(), record.id());
        auto it = positions.find(key);
        if (it == positions.end()) {
            positions.emplace(std::move(key), out.records.size());
            out.records.push_back(std::move(record));
            continue;
        }

        SoftwareRecord& kept = out.records[it->second];
        if (record.modified() > kept.modified()) {
            logDebug("duplicate " + record.kind() + " '" + record.id() +
                     "': keeping the more recently modified entry");
            kept = std::move(record);
        } else {
            logDebug("duplicate " + record.kind() + " '" + record.id() +
                     "': keeping the first entry");
        }
    }
    return out;
}
