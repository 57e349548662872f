#pragma once

#include <cstdint>
#include <limits>

#include "Eigen/Dense"
#include "XoshiroCpp.hpp"

static constexpr auto storage_order = Eigen::RowMajor;

using index_type = Eigen::Index;

using float_type = double;
using MatrixF =
    Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic, storage_order>;
using VectorMF = Eigen::Matrix<float_type, 1, Eigen::Dynamic, storage_order>;
using VectorAF = Eigen::Array<float_type, 1, Eigen::Dynamic, storage_order>;

// Seeded per component from Settings. There is no global generator.
using rng_type = XoshiroCpp::Xoshiro256Plus;

static constexpr auto inf_v = std::numeric_limits<float_type>::infinity();
static constexpr auto eps_v = std::numeric_limits<float_type>::epsilon();
