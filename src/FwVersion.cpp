/**
 * @file FwVersion.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Firmware version API
 * @version 0.2
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "FwVersion.hpp"

#include <cstdio>
#include <stddef.h>

namespace
{
    /* Major firmware version value */
    constexpr unsigned int FW_VERSION_MAJOR = 1;
    /* Minor firmware version value */
    constexpr unsigned int FW_VERSION_MINOR = 0;

    // Firmware product name
    constexpr const char *productName = "EXPANDER-BROKER";

    // MAJOR(2) + .(1) + MINOR(2) < 6
    constexpr size_t fwStringLength = 6;
} // namespace

const char *FwVersion::getVersionString()
{
    static char fwString[fwStringLength];

    snprintf(fwString, sizeof(fwString), "%u.%u", FW_VERSION_MAJOR, FW_VERSION_MINOR);

    return fwString;
}

const char *FwVersion::getProductName()
{
    return productName;
}
