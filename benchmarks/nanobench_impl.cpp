#define ANKERL_NANOBENCH_IMPLEMENTATION
#include <nanobench.h>
