#pragma once

#include <map>
#include <string>
#include <vector>

#include "activation.hpp"
#include "irreps.hpp"
#include "linear.hpp"
#include "parameters.hpp"

// Linear readouts serve every layer but the last, which uses
//     out = Linear_2(act(Linear_1(h)))
// with scalar hidden irreps.
enum class ReadoutKind { linear, nonlinear };

class Readout {

public:

Readout();
Readout(std::string name,
        ReadoutKind kind,
        Irreps irreps_in,
        Irreps irreps_out,
        Irreps mlp_irreps = Irreps(),
        Activation activation = Activation());

std::string name;
ReadoutKind kind;
Irreps irreps_in;
Irreps irreps_out;
Irreps mlp_irreps;
Activation activation;
Linear linear_1;
Linear linear_2;

void parameter_shapes(std::map<std::string,std::vector<int>>& shapes) const;

IrrepsArray hidden, hidden_deriv, activated, output;
void compute(const Parameters& parameters, const IrrepsArray& h);
// adds dE/dh to h_adj
void reverse(const Parameters& parameters, const IrrepsArray& output_adj, IrrepsArray& h_adj);

};
