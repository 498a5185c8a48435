/**
 * @file playback_state.hh
 * @brief Playback state shared by inputs and outputs
 * @ingroup core
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <audiocore/export_audiocore.h>

namespace audiocore {

    /**
     * @enum playback_state
     * @brief Whether an input or output emits real data
     *
     * Inputs move `stopped -> playing -> stopped`. Buffered inputs add
     * `buffering`, entered from start() and on underrun, left when the
     * ring reaches its fill threshold. Outputs never buffer.
     */
    enum class playback_state : uint8_t {
        stopped,
        buffering,
        playing
    };

    AUDIOCORE_EXPORT const char* to_string(playback_state state) noexcept;
    AUDIOCORE_EXPORT std::ostream& operator<<(std::ostream& os, playback_state state);

} // namespace audiocore
