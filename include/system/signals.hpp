#pragma once

#include "util/cancel_token.hpp"

namespace lsmux {

// SIGINT/SIGTERM cancel `token`. SIGPIPE is ignored so a client that dies
// mid-write surfaces as a write error instead of killing us.
void InstallSignalHandlers(CancelToken* token);

} // namespace lsmux
