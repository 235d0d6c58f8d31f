#pragma once

#include <Eigen/Dense>
#include <cmath>

namespace steadysolve {

// ============================================================================
// Forward-Mode Automatic Differentiation Value
// ============================================================================

/**
 * @brief Dual number carrying a value and its gradient with respect to the
 * independent variables of one Jacobian evaluation.
 *
 * An empty gradient stands for a constant (all partial derivatives zero), so
 * literals and parameters never allocate.
 */
struct ADValue {
    double value = 0.0;
    Eigen::VectorXd gradient;

    ADValue() = default;
    ADValue(double v) : value(v) {}
    ADValue(double v, Eigen::VectorXd grad) : value(v), gradient(std::move(grad)) {}

    static ADValue independent(double v, Eigen::Index index, Eigen::Index count) {
        ADValue ad(v, Eigen::VectorXd::Zero(count));
        ad.gradient(index) = 1.0;
        return ad;
    }

    bool isConstant() const { return gradient.size() == 0; }

    // Partial derivative with respect to independent variable `index`
    double derivative(Eigen::Index index) const {
        return isConstant() ? 0.0 : gradient(index);
    }
};

namespace detail {

// Gradient of f(x, y) given the partials df/dx and df/dy
inline Eigen::VectorXd chain(const ADValue& x, double dx, const ADValue& y, double dy) {
    if (x.isConstant() && y.isConstant()) return Eigen::VectorXd();
    if (x.isConstant()) return dy * y.gradient;
    if (y.isConstant()) return dx * x.gradient;
    return dx * x.gradient + dy * y.gradient;
}

inline ADValue apply(const ADValue& x, double value, double derivative) {
    if (x.isConstant()) return ADValue(value);
    return ADValue(value, derivative * x.gradient);
}

}  // namespace detail

// ============================================================================
// Arithmetic
// ============================================================================

inline ADValue operator+(const ADValue& x, const ADValue& y) {
    return ADValue(x.value + y.value, detail::chain(x, 1.0, y, 1.0));
}

inline ADValue operator-(const ADValue& x, const ADValue& y) {
    return ADValue(x.value - y.value, detail::chain(x, 1.0, y, -1.0));
}

inline ADValue operator*(const ADValue& x, const ADValue& y) {
    return ADValue(x.value * y.value, detail::chain(x, y.value, y, x.value));
}

inline ADValue operator/(const ADValue& x, const ADValue& y) {
    const double inv = 1.0 / y.value;
    return ADValue(x.value * inv, detail::chain(x, inv, y, -x.value * inv * inv));
}

inline ADValue operator-(const ADValue& x) {
    return detail::apply(x, -x.value, -1.0);
}

// ============================================================================
// Elementary functions
// ============================================================================

inline ADValue pow(const ADValue& x, const ADValue& y) {
    const double value = std::pow(x.value, y.value);
    if (y.isConstant()) {
        // Keeps negative bases with integer exponents differentiable
        return detail::apply(x, value, y.value * std::pow(x.value, y.value - 1.0));
    }
    return ADValue(value, detail::chain(x, y.value * std::pow(x.value, y.value - 1.0),
                                        y, value * std::log(x.value)));
}

inline ADValue exp(const ADValue& x) {
    const double e = std::exp(x.value);
    return detail::apply(x, e, e);
}

inline ADValue log(const ADValue& x) {
    return detail::apply(x, std::log(x.value), 1.0 / x.value);
}

inline ADValue log10(const ADValue& x) {
    return detail::apply(x, std::log10(x.value), 1.0 / (x.value * std::log(10.0)));
}

inline ADValue sqrt(const ADValue& x) {
    const double s = std::sqrt(x.value);
    return detail::apply(x, s, 0.5 / s);
}

inline ADValue abs(const ADValue& x) {
    const double sign = x.value > 0.0 ? 1.0 : (x.value < 0.0 ? -1.0 : 0.0);
    return detail::apply(x, std::abs(x.value), sign);
}

inline ADValue sin(const ADValue& x) {
    return detail::apply(x, std::sin(x.value), std::cos(x.value));
}

inline ADValue cos(const ADValue& x) {
    return detail::apply(x, std::cos(x.value), -std::sin(x.value));
}

inline ADValue tan(const ADValue& x) {
    const double c = std::cos(x.value);
    return detail::apply(x, std::tan(x.value), 1.0 / (c * c));
}

inline ADValue asin(const ADValue& x) {
    return detail::apply(x, std::asin(x.value), 1.0 / std::sqrt(1.0 - x.value * x.value));
}

inline ADValue acos(const ADValue& x) {
    return detail::apply(x, std::acos(x.value), -1.0 / std::sqrt(1.0 - x.value * x.value));
}

inline ADValue atan(const ADValue& x) {
    return detail::apply(x, std::atan(x.value), 1.0 / (1.0 + x.value * x.value));
}

inline ADValue sinh(const ADValue& x) {
    return detail::apply(x, std::sinh(x.value), std::cosh(x.value));
}

inline ADValue cosh(const ADValue& x) {
    return detail::apply(x, std::cosh(x.value), std::sinh(x.value));
}

inline ADValue tanh(const ADValue& x) {
    const double t = std::tanh(x.value);
    return detail::apply(x, t, 1.0 - t * t);
}

}  // namespace steadysolve
