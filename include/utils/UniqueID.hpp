/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace Vantage {
    /**
     * @brief Thread-safe generator for process-unique 64-bit identifiers.
     *
     * Used for collider ids. The first generated id is 1 so that INVALID_ID
     * (0) can mark "no body" in zero-initialized hit results.
     */
    class UniqueID {
    public:
        using IDType = uint64_t;

        static IDType generate() {
            return m_nextID.fetch_add(1, std::memory_order_relaxed);
        }

        static constexpr IDType INVALID_ID = 0;

    private:
        static inline std::atomic<IDType> m_nextID{1};
    };

} // namespace Vantage

#endif // UNIQUE_ID_HPP
