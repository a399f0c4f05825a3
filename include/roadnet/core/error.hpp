#pragma once

#include <stdexcept>
#include <string>

namespace roadnet::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct KeyError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// An edge attribute holds a value that cannot be used as a number.
struct InvalidAttributeType : public ValueError {
  using ValueError::ValueError;
};

// A required edge attribute is absent from every edge.
struct MissingAttribute : public KeyError {
  using KeyError::KeyError;
};

// A required edge attribute is absent or null on some edges.
struct NullAttribute : public ValueError {
  using ValueError::ValueError;
};

// No edge has an observed speed and no override or fallback was given.
struct UnresolvableSpeedData : public ValueError {
  using ValueError::ValueError;
};

// Batch origin and destination sequences differ in length.
struct MismatchedLengths : public ValueError {
  using ValueError::ValueError;
};

// Exactly one of origin/destination is a sequence.
struct MixedCardinality : public TypeError {
  using TypeError::TypeError;
};

// Consecutive route nodes are not connected by any edge.
struct DisconnectedPair : public KeyError {
  using KeyError::KeyError;
};

struct NodeNotFound : public KeyError {
  using KeyError::KeyError;
};

} // namespace roadnet::core
