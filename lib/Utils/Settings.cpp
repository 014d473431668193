/**
 * @file Settings.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Settings module implementation
 * @version 0.3
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Settings.hpp"

#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include <EEPROM.h>
#include <FastCRC.h>

#include <Log.hpp>

using namespace Settings;

namespace
{
    // Layout version, stored settings of another layout are discarded
    constexpr uint16_t layoutVersion = 0x0103;

#pragma pack(push, 1)
    /**
     * @brief Storage header placed before the blocks
     */
    struct Header
    {
        uint16_t layout; // Layout version
        uint32_t crc32;  // CRC32 of all blocks
    };
#pragma pack(pop)

    /**
     * @brief Address of the module block
     *
     * @param id Module identifier
     * @return Block address in the EEPROM
     */
    constexpr size_t blockAddress(Id id)
    {
        size_t address = sizeof(Header);

        for (size_t idx = 0; idx < static_cast<size_t>(id); idx++)
        {
            address += blocksList[idx].size + sizeof(uint8_t);
        }

        return address;
    }

    // Size of all blocks including their CRC8 values
    constexpr size_t blocksSize = blockAddress(Id::Count) - sizeof(Header);
    // Total storage size
    constexpr size_t storageSize = sizeof(Header) + blocksSize;

    constexpr size_t largestBlockSize()
    {
        size_t size = 0;

        for (const auto &block : blocksList)
        {
            size = (block.size > size) ? block.size : size;
        }

        return size;
    }

    // Guards the EEPROM buffer, modules update settings from several tasks
    std::mutex mutex;
    // Storage is initialized
    bool isReady = false;

    uint8_t calculateCrc8(const void *data, size_t size)
    {
        FastCRC8 fastCRC8;

        return ~fastCRC8.smbus(static_cast<const uint8_t *>(data), size);
    }

    uint32_t calculateCrc32()
    {
        uint8_t blocks[blocksSize];
        EEPROM.readBytes(sizeof(Header), blocks, blocksSize);

        FastCRC32 fastCRC32;

        return fastCRC32.crc32(blocks, blocksSize);
    }

    /**
     * @brief Write the header matching the current blocks and commit the storage
     */
    bool commit()
    {
        Header header = {.layout = layoutVersion, .crc32 = calculateCrc32()};
        EEPROM.put(0, header);

        return EEPROM.commit();
    }

    const Block &findBlock(Id id, size_t size)
    {
        const Block &block = blocksList[static_cast<size_t>(id)];

        if (size > block.size)
        {
            LOG_ERROR("%s settings size %u exceeds block size %u", block.name, static_cast<unsigned int>(size),
                      static_cast<unsigned int>(block.size));
        }

        return block;
    }
} // namespace

bool Settings::initialize()
{
    std::lock_guard<std::mutex> lock(mutex);

    if (EEPROM.begin(storageSize) == false)
    {
        LOG_ERROR("EEPROM initialize failed");
        return false;
    }

    isReady = true;

    Header header;
    EEPROM.get(0, header);

    if (header.layout == layoutVersion && header.crc32 == calculateCrc32())
    {
        LOG_INFO("Storage is valid, %u bytes", static_cast<unsigned int>(storageSize));
        return true;
    }

    LOG_WARNING("Storage isn't valid (layout 0x%04X), reset", header.layout);

    // Zero blocks fail their CRC8, modules write their defaults on the first read
    uint8_t blocks[blocksSize] = {0};
    EEPROM.writeBytes(sizeof(Header), blocks, blocksSize);
    commit();

    return false;
}

bool Settings::readBlock(Id id, void *data, size_t size)
{
    std::lock_guard<std::mutex> lock(mutex);

    const Block &block = findBlock(id, size);
    if (isReady == false || size > block.size)
    {
        return false;
    }

    size_t address = blockAddress(id);
    uint8_t buffer[largestBlockSize()];
    EEPROM.readBytes(address, buffer, size);
    uint8_t storedCrc8 = EEPROM.readByte(address + size);

    if (calculateCrc8(buffer, size) != storedCrc8)
    {
        LOG_WARNING("%s settings aren't valid", block.name);
        return false;
    }

    memcpy(data, buffer, size);

    return true;
}

bool Settings::writeBlock(Id id, const void *data, size_t size)
{
    std::lock_guard<std::mutex> lock(mutex);

    const Block &block = findBlock(id, size);
    if (isReady == false || size > block.size)
    {
        return false;
    }

    size_t address = blockAddress(id);
    EEPROM.writeBytes(address, data, size);
    EEPROM.writeByte(address + size, calculateCrc8(data, size));

    bool result = commit();
    if (result == false)
    {
        LOG_ERROR("%s settings commit failed", block.name);
    }
    else
    {
        LOG_DEBUG("%s settings stored", block.name);
    }

    return result;
}
