#pragma once

#include <iostream>

// Debug tracing for parser registration and parsing - disabled for release.
// Configure with -DVERDICT_TRACE=ON to enable.
#ifdef VERDICT_TRACE_ENABLED
#define VERDICT_TRACE(msg) std::cerr << "[verdict] " << msg << std::endl
#else
#define VERDICT_TRACE(msg) do {} while(0)
#endif
