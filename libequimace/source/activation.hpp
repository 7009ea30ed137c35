#pragma once

#include <string>

// Scalar nonlinearity scaled to unit second moment under a standard normal
// input. Supported names: silu, relu, gelu, abs, tanh, identity.
class Activation {

public:

Activation();
explicit Activation(const std::string& name);

std::string name;
double scale;

double evaluate(double x) const;
void evaluate_deriv(double x, double& f, double& d) const;

private:

enum class Kind { silu, relu, gelu, abs, tanh, identity };
Kind kind;

double raw(double x) const;
double raw_deriv(double x) const;

};
