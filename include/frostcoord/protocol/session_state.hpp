#pragma once

#include <string>
#include <string_view>

#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

const char* SessionStateName(SessionState state);
bool ParseSessionState(std::string_view name, SessionState* out);
const char* SessionEventName(SessionEvent event);

bool IsTerminalState(SessionState state);

// Position in the forward order pending < ... < aggregating < terminal. All
// terminal states share the highest rank.
int StateRank(SessionState state);

// Total over every (state, event) pair. Returns false and fills `error` for an
// illegal pair; never throws.
bool TryTransition(SessionState from,
                   SessionEvent event,
                   SessionState* to,
                   std::string* error);

}  // namespace frostcoord
