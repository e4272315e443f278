// omp_config.hpp - Parallel Switch

#pragma once

#if defined(_OPENMP)
#include <omp.h>
#define FDTDSG_OMP_ENABLED 1
#else
#define FDTDSG_OMP_ENABLED 0

//Provide a minimal 'stand-in' so the code can compile even without using #ifdef
inline int omp_get_max_threads() { return 1; }
#endif
