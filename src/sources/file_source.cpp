#include "file_source.h"

#include "../errors.h"

#include <fstream>
#include <iterator>
#include <utility>

FileSource::FileSource(std::string path)
    : path(std::move(path)) {}

std::string FileSource::fetch() {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open())
        throw SourceUnavailable("Unable to open file: " + path);

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad())
        throw SourceUnavailable("Error while reading file: " + path);
    return content;
}
