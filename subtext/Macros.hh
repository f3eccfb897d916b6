#pragma once
#include <cstdio>
#include <cstdlib>
#include <iostream>

#define SUBTEXT_ABORT_IF(condition, error) \
  do {                                     \
    if (condition) {                       \
      std::cerr << (error) << '\n';        \
      std::abort();                        \
    }                                      \
  } while (0)

#ifdef SUBTEXT_ENABLE_LOG
#define LOG(level, ...)              \
  do {                               \
    fprintf(stderr, "[%s]", #level); \
    fprintf(stderr, __VA_ARGS__);    \
    fprintf(stderr, "\n");           \
  } while (0)
#else  // SUBTEXT_ENABLE_LOG
#define LOG(...) (void)0
#endif  // SUBTEXT_ENABLE_LOG
