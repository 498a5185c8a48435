#include <audiocore/playback_state.hh>
#include <ostream>

namespace audiocore {
    const char* to_string(playback_state state) noexcept {
        switch (state) {
            case playback_state::stopped:   return "stopped";
            case playback_state::buffering: return "buffering";
            case playback_state::playing:   return "playing";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, playback_state state) {
        return os << to_string(state);
    }
}
