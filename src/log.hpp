#pragma once

#include <cstdio>

#include <fmt/core.h>

// configure with -DBISCUIT8_DEBUG=ON to trace the interpreter on stderr
#ifdef BISCUIT8_DEBUG
#define BISCUIT8_LOG(...) fmt::print(stderr, __VA_ARGS__)
#define BISCUIT8_LOGLN(...) (fmt::print(stderr, __VA_ARGS__), std::fputc('\n', stderr))
#else
#define BISCUIT8_LOG(...) ;
#define BISCUIT8_LOGLN(...) ;
#endif
