#pragma once

#include <string>

// A zero-argument, host-dependent producer of raw inventory output.
// fetch() returns the bytes exactly as the tool or file produced them and
// throws SourceUnavailable when nothing could be obtained.
class IRawSource {
public:
    virtual ~IRawSource() = default;
    virtual std::string fetch() = 0;
    virtual std::string describe() const = 0;
};
