#pragma once

#include <stdexcept>
#include <string>

// Inconsistent model configuration, detected while building a model.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Invalid input data for a single evaluation (e.g. superimposed atoms).
class DomainError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// Parameter tree incompatible with the model it is used with.
class ShapeMismatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
