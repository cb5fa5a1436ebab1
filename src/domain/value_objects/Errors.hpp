#pragma once

#include <stdexcept>
#include <string>

namespace pqe::domain {

// Operands carry different dimensions (or a dimensioned exponent).
class DimensionMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Forced prefix on a quantity with a non-unit factor, or unknown prefix symbol.
class InvalidPrefixRequest : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Operand that cannot be coerced to a compatible numeric representation.
class IncompatibleOperand : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Unit name not present in the registry.
class UnknownUnit : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

} // namespace pqe::domain
