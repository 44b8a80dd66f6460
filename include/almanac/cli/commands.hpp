#pragma once

#include <functional>

namespace almanac::cli {

/// Entry point behind main(); returns the process exit code.
int run_cli(int argc, char **argv);

/// Blocks until a newline arrives on `input_fd` or `stop_requested()` returns true. End of
/// input only stops watching the descriptor; the wait continues until a stop is requested.
void wait_for_stop(int input_fd, const std::function<bool()> &stop_requested);

} // namespace almanac::cli
