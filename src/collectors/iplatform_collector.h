#pragma once

#include "../software_entry.h"

#include <string>

// One implementation per supported operating system. collect() returns
// the OS record first, then applications/packages, then drivers, each in
// the order the raw source listed them. Categories that fail contribute a
// diagnostic; CollectionFailed is thrown only when every category failed.
class IPlatformCollector {
public:
    virtual ~IPlatformCollector() = default;
    virtual std::string platformName() const = 0;
    virtual InventoryResult collect() = 0;
};
