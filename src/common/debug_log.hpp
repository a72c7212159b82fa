#pragma once

// Diagnostics go to stderr so they never interleave with the transcript on stdout.
#ifndef NDEBUG
    #include <iostream>
    #define DEBUG_LOG(x) std::cerr << "[debug] " << x
    #define DEBUG_LOG_ENDL std::endl
#else
    #define DEBUG_LOG(x) ((void)0)
    #define DEBUG_LOG_ENDL ((void)0)
#endif
