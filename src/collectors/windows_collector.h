#pragma once

#include "iplatform_collector.h"
#include "../parsers/table_parser.h"
#include "../sources/iraw_source.h"

#include <memory>

// OS identity from `ver`, applications from the uninstall registry keys,
// drivers from `driverquery /v /FO CSV`.
class WindowsCollector final : public IPlatformCollector {
public:
    WindowsCollector(std::unique_ptr<IRawSource> versionSource,
                     std::unique_ptr<IRawSource> registrySource,
                     std::unique_ptr<IRawSource> driverSource);

    std::string platformName() const override { return "Microsoft Windows"; }
    InventoryResult collect() override;

    static TableColumnMap driverColumns();

    // "Microsoft Windows [Version 10.0.19045.3086]" → "10.0.19045.3086".
    // Works on the raw bytes, whatever code page the localized word is in.
    // Throws MalformedSource when no bracketed version number is present.
    static std::string parseVerOutput(const std::string& text);

private:
    std::unique_ptr<IRawSource> versionSource;
    std::unique_ptr<IRawSource> registrySource;
    std::unique_ptr<IRawSource> driverSource;
};
