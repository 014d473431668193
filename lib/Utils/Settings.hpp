/**
 * @file Settings.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Settings module API
 * @version 0.3
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

namespace Settings
{
    /**
     * @brief Settings modules identifiers
     */
    enum class Id
    {
        Broker,        // Broker configuration
        Boards,        // Known boards and their direction registers
        SerialManager, // Serial slave address
        LogModule,     // Runtime log level

        Count // Total count of settings modules
    };

    /**
     * @brief Storage block of one module
     */
    struct Block
    {
        Id id;           // Module identifier
        const char *name; // Module name for logging
        size_t size;     // Maximum data size, CRC8 is stored right after the data
    };

    // Storage blocks in the EEPROM order
    constexpr Block blocksList[] = {
        {.id = Id::Broker, .name = "Broker", .size = 28},              // uint32_t * 7
        {.id = Id::Boards, .name = "Boards", .size = 17},              // uint8_t + uint8_t * 8 * 2
        {.id = Id::SerialManager, .name = "SerialManager", .size = 4}, // int
        {.id = Id::LogModule, .name = "LogModule", .size = 1},         // uint8_t
    };
    static_assert(sizeof(blocksList) / sizeof(*blocksList) == static_cast<size_t>(Id::Count),
                  "Blocks list doesn't match to modules count!");

    /**
     * @brief Initialize settings storage, reset it if layout or CRC32 doesn't match
     *
     * @return true if stored settings are valid, false if storage is reset or unavailable
     */
    bool initialize();

    /**
     * @brief Read module block and check its CRC8
     *
     * @param[in] id Module identifier
     * @param[out] data Data buffer
     * @param[in] size Data size
     * @return true if stored data is valid and read, false otherwise
     */
    bool readBlock(Id id, void *data, size_t size);

    /**
     * @brief Write module block with its CRC8 and commit the storage
     *
     * @param[in] id Module identifier
     * @param[in] data Data to write
     * @param[in] size Data size
     * @return true if block is written, false otherwise
     */
    bool writeBlock(Id id, const void *data, size_t size);

    /**
     * @brief Update module settings in internal storage
     *
     * @tparam Type Type of data to update
     * @param id Module identifier
     * @param data Data to update
     * @return true if settings are stored, false otherwise
     */
    template <typename Type>
    bool update(Id id, const Type &data)
    {
        return writeBlock(id, &data, sizeof(Type));
    }

    /**
     * @brief Read module settings from internal storage.
     * If stored data isn't valid the current data is written to the storage
     *
     * @tparam Type Type of data to read
     * @param id Module identifier
     * @param data Current data, replaced by the stored data if it is valid
     * @return true if stored data is valid and read, false if storage is updated with current data
     */
    template <typename Type>
    bool read(Id id, Type &data)
    {
        Type storedData;
        if (readBlock(id, &storedData, sizeof(Type)) == true)
        {
            data = storedData;
            return true;
        }

        update(id, data);

        return false;
    }
} // namespace Settings
