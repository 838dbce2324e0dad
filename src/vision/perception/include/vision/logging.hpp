#pragma once

namespace marksman::vision {

//! Install the global severity filter of the trivial logger. `info` and above by default, `debug` when verbose.
void initLogging(bool verbose = false);

} // namespace marksman::vision
