#ifndef KADMOS_NETWORK_VARIABLE_HPP
#define KADMOS_NETWORK_VARIABLE_HPP

#include <optional>
#include <string>

namespace kadmos {
namespace network {

/**
 * @brief Scalar model unknown with optional bounds
 *
 * A fixed variable is excluded from the solver unknown vector. Every write
 * through setValue()/fix() is clipped into [lower, upper] when bounds are set.
 */
class Variable {
public:
    Variable(const std::string& name, double value, bool fixed = false,
             std::optional<double> lower = std::nullopt,
             std::optional<double> upper = std::nullopt);
    ~Variable() = default;

    const std::string& name() const { return name_; }
    double value() const { return value_; }
    bool isFixed() const { return fixed_; }
    std::optional<double> lower() const { return lower_; }
    std::optional<double> upper() const { return upper_; }

    void setValue(double value);
    void fix();
    void fix(double value);
    void unfix() { fixed_ = false; }
    void clip();

private:
    std::string name_;
    double value_;
    bool fixed_;
    std::optional<double> lower_;
    std::optional<double> upper_;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_VARIABLE_HPP
