#pragma once
#include <cstddef>

#define EIGEN_DONT_PARALLELIZE // the KPM samples are already spread over threads
#define EIGEN_DEFAULT_DENSE_INDEX_TYPE std::ptrdiff_t
#define EIGEN_DEFAULT_TO_ROW_MAJOR

namespace kpmdos {
    using idx_t = std::ptrdiff_t; // type for general indexing and interfaces
    using storage_idx_t = int; // type used when storing indices in containers
}
