#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "gridopt/config.hpp"

class GridError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Malformed or disconnected initial graph. Only raised while building a
// topology, never during a cycle.
class TopologyError : public GridError {
 public:
  using GridError::GridError;
};

class UnknownEntityError : public GridError {
 public:
  UnknownEntityError(const std::string& kind, std::vector<index_type> ids);

  const std::string kind;
  const std::vector<index_type> ids;
};

class NoPathError : public GridError {
 public:
  NoPathError(index_type source, index_type target);

  const index_type source;
  const index_type target;
};

class RiskOracleUnavailable : public GridError {
 public:
  using GridError::GridError;
};

class ConfigError : public GridError {
 public:
  using GridError::GridError;
};

class CheckpointError : public GridError {
 public:
  using GridError::GridError;
};
