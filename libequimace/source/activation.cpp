#include <cmath>
#include <numbers>

#include "errors.hpp"

#include "activation.hpp"

Activation::Activation()
    : Activation("identity")
{
}

Activation::Activation(const std::string& name)
    : name(name)
{
    if (name == "silu")
        kind = Kind::silu;
    else if (name == "relu")
        kind = Kind::relu;
    else if (name == "gelu")
        kind = Kind::gelu;
    else if (name == "abs")
        kind = Kind::abs;
    else if (name == "tanh")
        kind = Kind::tanh;
    else if (name == "identity")
        kind = Kind::identity;
    else
        throw ConfigurationError("Unknown activation '" + name + "'");

    // second moment under N(0,1) by trapezoidal quadrature on [-12,12]
    const int n = 24000;
    const double h = 24.0/n;
    double second_moment = 0.0;
    for (int i=0; i<=n; ++i) {
        const double x = -12.0 + i*h;
        const double w = (i == 0 or i == n) ? 0.5 : 1.0;
        const double f = raw(x);
        second_moment += w * h * f*f * std::exp(-0.5*x*x);
    }
    second_moment /= std::sqrt(2.0*std::numbers::pi);
    scale = (kind == Kind::identity) ? 1.0 : 1.0/std::sqrt(second_moment);
}

double Activation::evaluate(double x) const
{
    return scale*raw(x);
}

void Activation::evaluate_deriv(double x, double& f, double& d) const
{
    f = scale*raw(x);
    d = scale*raw_deriv(x);
}

double Activation::raw(double x) const
{
    switch (kind) {
        case Kind::silu:
            return x/(1.0+std::exp(-x));
        case Kind::relu:
            return (x > 0.0) ? x : 0.0;
        case Kind::gelu: {
            // tanh approximation
            const double s = std::sqrt(2.0/std::numbers::pi)*(x+0.044715*x*x*x);
            return 0.5*x*(1.0+std::tanh(s));
        }
        case Kind::abs:
            return std::abs(x);
        case Kind::tanh:
            return std::tanh(x);
        case Kind::identity:
            return x;
    }
    return x;
}

double Activation::raw_deriv(double x) const
{
    switch (kind) {
        case Kind::silu: {
            const double sigmoid = 1.0/(1.0+std::exp(-x));
            return sigmoid + x*sigmoid*(1-sigmoid);
        }
        case Kind::relu:
            return (x > 0.0) ? 1.0 : 0.0;
        case Kind::gelu: {
            const double k = std::sqrt(2.0/std::numbers::pi);
            const double t = std::tanh(k*(x+0.044715*x*x*x));
            return 0.5*(1.0+t) + 0.5*x*(1.0-t*t)*k*(1.0+3*0.044715*x*x);
        }
        case Kind::abs:
            return (x > 0.0) ? 1.0 : ((x < 0.0) ? -1.0 : 0.0);
        case Kind::tanh: {
            const double t = std::tanh(x);
            return 1.0-t*t;
        }
        case Kind::identity:
            return 1.0;
    }
    return 1.0;
}
