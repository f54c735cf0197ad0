#pragma once

#include <stdexcept>

// A raw source could not produce any output (tool missing, non-zero exit,
// unreadable file, wrong operating system).
class SourceUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raw output exists but cannot be interpreted as the expected format.
// Recoverable: the affected category contributes no records.
class MalformedSource : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Nothing at all could be collected on this host. Fatal for the run.
class CollectionFailed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
