#pragma once

#include "iplatform_collector.h"

#include <memory>

// Collector for the operating system this binary was built for, wired to
// the real raw sources. Throws CollectionFailed on unsupported hosts.
std::unique_ptr<IPlatformCollector> makeHostCollector();
