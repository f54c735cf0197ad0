#pragma once

#include "collectors/iplatform_collector.h"
#include "software_entry.h"

#include <vector>

class Aggregator {
public:
    // Runs the collector and returns its validated, de-duplicated records
    // together with every diagnostic. Throws CollectionFailed when the
    // collector does or when it produced no records at all.
    InventoryResult run(IPlatformCollector& collector) const;

    // Drops records whose name or id is blank (one diagnostic each) and collapses
    // records sharing (kind, id): the later `modified` wins, ties keep the
    // first seen, and the survivor takes the first occurrence's position.
    InventoryResult normalize(InventoryResult collected) const;
};
