#pragma once

namespace platform {

// Detaches from the controlling terminal. Returns in the grandchild only.
void daemonize();

} // namespace platform
