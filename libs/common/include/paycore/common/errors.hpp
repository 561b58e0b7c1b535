#pragma once

#include <stdexcept>
#include <string>

namespace paycore {
namespace common {

// Raised when an input source or output sink cannot be opened, read or written.
class IoError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace common
}  // namespace paycore
