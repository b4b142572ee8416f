#pragma once

#include <stdexcept>
#include <string>

namespace sprig::aot {

// Any failure while processing bean factories or generating code
class AotProcessingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Generated output could not be written; earlier output is left untouched
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace sprig::aot
