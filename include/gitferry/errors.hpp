#pragma once
#include <stdexcept>
#include <string>

namespace gitferry {

// Artifact missing or unreadable. Raised before any chunk is generated.
class NotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A byte range that violates the envelope layout. Always an implementation bug.
class OutOfRangeError : public std::out_of_range {
public:
  using std::out_of_range::out_of_range;
};

// The remote refused a request or could not be reached.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace gitferry
