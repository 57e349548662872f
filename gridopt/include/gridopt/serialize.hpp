#pragma once

#include "Eigen/Dense"
#include "cereal/cereal.hpp"

namespace cereal {

// Upper bound on a stored dense block, so a corrupted shape header fails
// cleanly instead of allocating.
static constexpr Eigen::Index max_stored_coefficients = Eigen::Index(1) << 28;

template <class Archive, class T>
concept is_output_binary_serializable =
    traits::is_output_serializable<BinaryData<T>, Archive>::value;

template <class Archive, class T>
concept is_input_binary_serializable =
    traits::is_input_serializable<BinaryData<T>, Archive>::value;

// Dynamic extents first, then the raw coefficients in storage order.
template <class Archive, class Derived>
requires is_output_binary_serializable<Archive, typename Derived::Scalar>
void save(Archive &ar, Eigen::PlainObjectBase<Derived> const &m) {
  using Dense = Eigen::PlainObjectBase<Derived>;

  if (Dense::RowsAtCompileTime == Eigen::Dynamic) ar(m.rows());
  if (Dense::ColsAtCompileTime == Eigen::Dynamic) ar(m.cols());
  ar(binary_data(m.data(), m.size() * sizeof(typename Derived::Scalar)));
}

template <class Archive, class Derived>
requires is_input_binary_serializable<Archive, typename Derived::Scalar>
void load(Archive &ar, Eigen::PlainObjectBase<Derived> &m) {
  using Dense = Eigen::PlainObjectBase<Derived>;

  Eigen::Index rows = Dense::RowsAtCompileTime;
  Eigen::Index cols = Dense::ColsAtCompileTime;
  if (rows == Eigen::Dynamic) ar(rows);
  if (cols == Eigen::Dynamic) ar(cols);
  if (rows < 0 || cols < 0 ||
      (rows && cols > max_stored_coefficients / rows)) {
    throw Exception("stored matrix has an invalid shape");
  }
  m.resize(rows, cols);
  ar(binary_data(m.data(), m.size() * sizeof(typename Derived::Scalar)));
}

}  // namespace cereal
