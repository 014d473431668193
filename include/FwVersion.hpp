/**
 * @file FwVersion.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Firmware version API
 * @version 0.2
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

namespace FwVersion
{
    /**
     * @brief Get firmware version string "MAJOR.MINOR"
     *
     * @return Version string
     */
    const char *getVersionString();

    /**
     * @brief Get firmware product name
     *
     * @return Product name string
     */
    const char *getProductName();
} // namespace FwVersion
