#ifndef QUATERNET_CORE_LOG_HPP
#define QUATERNET_CORE_LOG_HPP

#include <iostream>

// Diagnostics are compiled in only with -DQUATERNET_VERBOSE.
#ifdef QUATERNET_VERBOSE
#define QUATERNET_LOG_WARN(msg) do { std::cerr << "[quaternet] " << msg << std::endl; } while (0)
#else
#define QUATERNET_LOG_WARN(msg) do { } while (0)
#endif

#endif // QUATERNET_CORE_LOG_HPP
