#include "Broker/BoardStorage.hpp"

#include <array>
#include <mutex>
#include <stdint.h>
#include <string.h>

#include <Log.hpp>
#include <Settings.hpp>

#include "Expander/Registers.hpp"

using namespace Broker;
using namespace Expander;

namespace
{
    // Settings identifier in internal storage
    constexpr auto settingsId = Settings::Id::Boards;

#pragma pack(push, 1)
    /**
     * @brief Non volatile settings structure
     */
    struct BoardsSettings
    {
        uint8_t knownMask;                       // Bit n is set if board at slot n has stored directions
        uint8_t direction[boardCount][halfCount]; // Direction register halves per board slot
    };
#pragma pack(pop)

    // Nothing is known initially
    BoardsSettings settings = {};

    // Guards settings, updated from the dispatcher thread and by the restore failures
    std::recursive_mutex mutex;

    bool isKnown(size_t slot)
    {
        return (settings.knownMask & (1 << slot)) != 0;
    }

    void forget(size_t slot)
    {
        settings.knownMask &= ~(1 << slot);
    }
} // namespace

void BoardStorage::initialize()
{
    std::lock_guard<std::recursive_mutex> lock(mutex);

    Settings::read(settingsId, settings);

    LOG_INFO("Stored boards mask 0x%02X", settings.knownMask);
}

size_t BoardStorage::restore(Context &context)
{
    std::lock_guard<std::recursive_mutex> lock(mutex);

    size_t restored = 0;
    uint8_t knownMask = settings.knownMask;

    for (size_t slot = 0; slot < boardCount; slot++)
    {
        if (isKnown(slot) == false)
        {
            continue;
        }

        uint8_t address = static_cast<uint8_t>(boardAddressMin + slot);
        std::array<uint8_t, halfCount> direction = {settings.direction[slot][0], settings.direction[slot][1]};

        bool result = context.restoreDirections(address, direction);
        if (result == true)
        {
            restored++;
        }
        else
        {
            LOG_WARNING("Board 0x%02X is forgotten", address);
            forget(slot);
        }
    }

    if (settings.knownMask != knownMask)
    {
        Settings::update(settingsId, settings);
    }

    LOG_INFO("%u boards restored", static_cast<unsigned int>(restored));

    return restored;
}

/**
 * @brief Remember directions of the present board or forget the lost one.
 * Storage is written only when the stored state changes.
 *
 * @param state Board state reported by the dispatcher
 */
void BoardStorage::update(const BoardState &state)
{
    if (isValidBoard(state.address) == false)
    {
        return;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex);

    size_t slot = boardSlot(state.address);
    BoardsSettings newSettings = settings;

    if (state.present == true)
    {
        newSettings.knownMask |= (1 << slot);
        newSettings.direction[slot][0] = state.direction[0];
        newSettings.direction[slot][1] = state.direction[1];
    }
    else
    {
        newSettings.knownMask &= ~(1 << slot);
    }

    if (memcmp(&newSettings, &settings, sizeof(settings)) != 0)
    {
        LOG_DEBUG("Store board 0x%02X: %s, directions 0x%04X", state.address, state.present ? "present" : "lost",
                  combine(state.direction[0], state.direction[1]));

        settings = newSettings;
        Settings::update(settingsId, settings);
    }
}
