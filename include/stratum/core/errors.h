#pragma once
#include <stdexcept>
#include <string>

namespace stratum::core {

// Raised when a resolved style value is neither of the forms a consumer
// can handle, e.g. a z-index that is not auto and not an integer. This
// points at an upstream style resolution defect.
class InvalidStyleValue : public std::runtime_error {
public:
    InvalidStyleValue(const std::string& property, const std::string& value)
        : std::runtime_error("invalid value '" + value + "' for " + property),
          property_(property), value_(value) {}

    const std::string& property() const { return property_; }
    const std::string& value() const { return value_; }

private:
    std::string property_;
    std::string value_;
};

} // namespace stratum::core
