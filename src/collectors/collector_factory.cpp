#include "collector_factory.h"

#include "../errors.h"

#if defined(__APPLE__)
#include "macos_collector.h"
#include "../sources/command_source.h"
#elif defined(_WIN32)
#include "windows_collector.h"
#include "../sources/command_source.h"
#include "../sources/registry_export_source.h"
#elif defined(__linux__)
#include "linux_collector.h"
#include "../sources/command_source.h"
#include "../sources/file_source.h"
#endif

std::unique_ptr<IPlatformCollector> makeHostCollector() {
#if defined(__APPLE__)
    return std::make_unique<MacOsCollector>(
        std::make_unique<CommandSource>(
            "system_profiler SPSoftwareDataType SPApplicationsDataType "
            "SPExtensionsDataType -detailLevel full"));
#elif defined(_WIN32)
    return std::make_unique<WindowsCollector>(
        std::make_unique<CommandSource>("cmd.exe /c ver"),
        std::make_unique<RegistryExportSource>(),
        std::make_unique<CommandSource>("driverquery.exe /v /FO CSV"));
#elif defined(__linux__)
    return std::make_unique<LinuxCollector>(
        std::make_unique<FileSource>("/etc/os-release"),
        std::make_unique<CommandSource>(
            "dpkg-query -W -f='Package: ${Package}\\nVersion: ${Version}\\n"
            "Maintainer: ${Maintainer}\\nStatus: ${Status}\\n\\n'"));
#else
    throw CollectionFailed("unsupported operating system");
#endif
}
