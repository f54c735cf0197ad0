#pragma once

#include "iraw_source.h"

// Reads a whole file in binary mode.
class FileSource final : public IRawSource {
public:
    explicit FileSource(std::string path);

    std::string fetch() override;
    std::string describe() const override { return path; }

private:
    std::string path;
};
