#pragma once

#include <iostream>

// Compile with -DGRIDPRICE_DEBUG to enable
#ifdef GRIDPRICE_DEBUG
#define DEBUG_LOG(x) std::cerr << x << std::endl
#else
#define DEBUG_LOG(x)
#endif

#define WARN_LOG(x) std::cerr << "Warning: " << x << "\n"
