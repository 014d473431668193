/**
 * @file Log.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Log module implementation
 * @version 0.3
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Log.hpp"

#include <assert.h>
#include <atomic>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

using namespace Log;

namespace
{
    // Longest log line including the header
    constexpr size_t lineLength = 256;

    /**
     * @brief Printed attributes of a log level
     */
    struct LevelStyle
    {
        char tag;          // One letter level tag
        const char *color; // Terminal color sequence
    };

    // Styles of the printed levels, starting from LOG_LEVEL_ERROR
    constexpr LevelStyle levelStyles[] = {
        {.tag = 'E', .color = "\033[0;31m"}, // Red
        {.tag = 'W', .color = "\033[0;33m"}, // Brown
        {.tag = 'I', .color = "\033[0;32m"}, // Green
        {.tag = 'D', .color = "\033[0;36m"}, // Cyan
        {.tag = 'T', .color = "\033[0;35m"}, // Purple
    };
    static_assert(sizeof(levelStyles) / sizeof(*levelStyles) == LOG_LEVEL_COUNT - LOG_LEVEL_ERROR,
                  "Level styles list doesn't match to log levels count!");

    constexpr const char *resetColor = "\033[0m";
    // Reset color sequence and new line characters
    constexpr size_t lineEndLength = 8;

    // Output is replaced only by initialize, guarded to keep lines of concurrent tasks whole
    std::mutex outputMutex;
    Output output = {};

    std::atomic<uint8_t> maxLevel(LOG_LEVEL);

    /**
     * @brief Get source file name without directories and extension
     *
     * @param[in] source Source file path
     * @param[out] length Name length
     * @return Name start
     */
    const char *sourceName(const char *source, int &length)
    {
        const char *slash = strrchr(source, '/');
        const char *name = slash ? slash + 1 : source;
        const char *dot = strrchr(name, '.');

        length = static_cast<int>(dot ? dot - name : strlen(name));

        return name;
    }
} // namespace

void Log::initialize(const Output &newOutput, uint8_t level)
{
    {
        std::lock_guard<std::mutex> lock(outputMutex);
        output = newOutput;
    }

    if (setMaxLevel(level) == false)
    {
        maxLevel.store(LOG_LEVEL);
    }
}

/**
 * @brief Print log message according formatted string with header and new line characters.
 * Line is "<tag> (<ms>) <source>: <message>", too long messages are truncated
 *
 * @param[in] logLevel Level of log message
 * @param[in] source Source file of message
 * @param[in] format Formatted string
 */
void Log::println(uint8_t logLevel, const char *source, const char *format, ...)
{
    assert(logLevel >= LOG_LEVEL_ERROR && logLevel < LOG_LEVEL_COUNT);
    assert(source);
    assert(format);

    if (logLevel > maxLevel.load())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(outputMutex);

    const LevelStyle &style = levelStyles[logLevel - LOG_LEVEL_ERROR];
    unsigned long timestamp = output.clock ? output.clock() : 0;
    int nameLength;
    const char *name = sourceName(source, nameLength);

    // Leave space for the line end
    char line[lineLength + lineEndLength];
    int offset = snprintf(line, lineLength, "%s%c (%lu) %.*s: ", output.colors ? style.color : "", style.tag,
                          timestamp, nameLength, name);

    if (offset > 0 && static_cast<size_t>(offset) < lineLength)
    {
        va_list args;
        va_start(args, format);
        vsnprintf(&line[offset], lineLength - offset, format, args);
        va_end(args);
    }

    size_t length = strlen(line);
    snprintf(&line[length], sizeof(line) - length, "%s\r\n", output.colors ? resetColor : "");

    if (output.writer)
    {
        output.writer(line);
    }
    else
    {
        fputs(line, stderr);
    }
}

bool Log::setMaxLevel(uint8_t level)
{
    if (level > LOG_LEVEL)
    {
        return false;
    }

    maxLevel.store(level);

    return true;
}

uint8_t Log::getMaxLevel()
{
    return maxLevel.load();
}
