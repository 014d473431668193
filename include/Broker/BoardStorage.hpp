#pragma once

#include "Context.hpp"
#include "Dispatcher.hpp"

namespace Broker
{
    /**
     * @brief Non volatile storage of the board directions
     */
    namespace BoardStorage
    {
        /**
         * @brief Read stored directions
         */
        void initialize();

        /**
         * @brief Restore stored directions of every known board, boards that fail are forgotten
         * @warning Broker must be stopped
         *
         * @param context Broker instance
         * @return Count of restored boards
         */
        size_t restore(Context &context);

        /**
         * @brief Remember directions of the present board or forget the lost one
         *
         * @param state Board state reported by the dispatcher
         */
        void update(const BoardState &state);
    } // namespace BoardStorage
} // namespace Broker
