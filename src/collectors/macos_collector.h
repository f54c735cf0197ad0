#pragma once

#include "iplatform_collector.h"
#include "../parsers/block_parser.h"
#include "../sources/iraw_source.h"

#include <memory>

// Reads one system_profiler text report covering the Software,
// Applications and Extensions data types.
class MacOsCollector final : public IPlatformCollector {
public:
    explicit MacOsCollector(std::unique_ptr<IRawSource> profiler);

    std::string platformName() const override { return "macOS"; }
    InventoryResult collect() override;

    static BlockFieldTable applicationTable();
    static BlockFieldTable extensionTable();

    // "macOS 13.4 (22F66)" → "13.4 (22F66)"
    static std::string osVersionFromSoftwareSection(const std::string& body);

private:
    std::unique_ptr<IRawSource> profiler;
};
