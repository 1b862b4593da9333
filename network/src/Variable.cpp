#include "Variable.hpp"
#include <stdexcept>

namespace kadmos {
namespace network {

Variable::Variable(const std::string& name, double value, bool fixed,
                   std::optional<double> lower, std::optional<double> upper)
    : name_(name)
    , value_(value)
    , fixed_(fixed)
    , lower_(lower)
    , upper_(upper)
{
    if (lower_ && upper_ && *lower_ > *upper_) {
        throw std::invalid_argument("Variable '" + name + "' has lower bound above upper bound");
    }
    clip();
}

void Variable::setValue(double value) {
    value_ = value;
    clip();
}

void Variable::fix() {
    fixed_ = true;
}

void Variable::fix(double value) {
    setValue(value);
    fixed_ = true;
}

void Variable::clip() {
    if (lower_ && value_ < *lower_) {
        value_ = *lower_;
    }
    if (upper_ && value_ > *upper_) {
        value_ = *upper_;
    }
}

} // namespace network
} // namespace kadmos
