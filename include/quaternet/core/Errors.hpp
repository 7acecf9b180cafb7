#ifndef QUATERNET_CORE_ERRORS_HPP
#define QUATERNET_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace quaternet {

// Input rank not in {2, 3}, or last axis not a multiple of 4.
class ShapeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Weight blocks (or bias) that must agree in shape do not.
class SizeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Initialization criterion other than "glorot" or "he".
class InvalidCriterion : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Unrecognized mode string for an enumerated option (dropout type, operation, init scheme).
class InvalidOperationArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace quaternet

#endif // QUATERNET_CORE_ERRORS_HPP
