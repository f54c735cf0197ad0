#pragma once

#include "iplatform_collector.h"
#include "../parsers/block_parser.h"
#include "../sources/iraw_source.h"

#include <memory>

// OS identity from os-release, packages from the dpkg database rendered
// as deb822 stanzas by dpkg-query.
class LinuxCollector final : public IPlatformCollector {
public:
    LinuxCollector(std::unique_ptr<IRawSource> osReleaseSource,
                   std::unique_ptr<IRawSource> packageSource);

    std::string platformName() const override { return "Linux"; }
    InventoryResult collect() override;

    static BlockFieldTable packageTable();

    // VERSION_ID, else VERSION, from os-release text. Throws
    // MalformedSource when neither is present.
    static std::string parseOsRelease(const std::string& text);

private:
    std::unique_ptr<IRawSource> osReleaseSource;
    std::unique_ptr<IRawSource> packageSource;
};
