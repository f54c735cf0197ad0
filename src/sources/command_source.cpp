#include "command_source.h"

#include "../errors.h"
#include "../helper/logger.h"
#include "../helper/text_utils.h"

#include <cstdio>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#endif

#ifdef _WIN32
#define UNISBOM_POPEN  _popen
#define UNISBOM_PCLOSE _pclose
#define UNISBOM_READ_MODE "rb"
#else
#define UNISBOM_POPEN  popen
#define UNISBOM_PCLOSE pclose
#define UNISBOM_READ_MODE "r"
#endif

CommandSource::CommandSource(std::string commandLine)
    : commandLine(std::move(commandLine)) {}

std::string CommandSource::fetch() {
    logDebug("running: " + commandLine);

    FILE* pipe = UNISBOM_POPEN(commandLine.c_str(), UNISBOM_READ_MODE);
    if (!pipe)
        throw SourceUnavailable("could not execute " + commandLine);

    std::string output;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
        output.append(buffer, n);

    const int status = UNISBOM_PCLOSE(pipe);
    if (status != 0) {
        throw SourceUnavailable(commandLine + " exited with status " +
                                std::to_string(status));
    }
#ifdef _WIN32
    // Console tools print in the console code page; the parsers read UTF-8.
    // UTF-16 output (BOM) is left for decodeText.
    const bool utf16 = output.size() >= 2 &&
                       static_cast<unsigned char>(output[0]) == 0xFF &&
                       static_cast<unsigned char>(output[1]) == 0xFE;
    if (!utf16 && !isValidUtf8(output)) {
        UINT codePage = GetConsoleOutputCP();
        if (codePage == 0)
            codePage = CP_OEMCP;
        std::string converted = codePageToUtf8(output, codePage);
        if (!converted.empty())
            output = std::move(converted);
    }
#endif
    return output;
}
