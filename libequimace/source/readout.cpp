#include "errors.hpp"

#include "readout.hpp"

Readout::Readout()
    : kind(ReadoutKind::linear)
{
}

Readout::Readout(
    std::string name,
    ReadoutKind kind,
    Irreps irreps_in,
    Irreps irreps_out,
    Irreps mlp_irreps,
    Activation activation)
    : name(name),
      kind(kind),
      irreps_in(irreps_in),
      irreps_out(irreps_out),
      mlp_irreps(mlp_irreps),
      activation(activation)
{
    if (kind == ReadoutKind::linear) {
        linear_1 = Linear(irreps_in, irreps_out);
        return;
    }
    if (mlp_irreps.dim() == 0)
        throw ConfigurationError(name + ": empty hidden irreps");
    for (const auto& block : mlp_irreps)
        if (not block.ir.is_scalar())
            throw ConfigurationError(name + ": hidden irreps " + mlp_irreps.to_string() + " must be scalars");
    linear_1 = Linear(irreps_in, mlp_irreps);
    linear_2 = Linear(mlp_irreps, irreps_out);
}

void Readout::parameter_shapes(
    std::map<std::string,std::vector<int>>& shapes) const
{
    if (kind == ReadoutKind::linear) {
        shapes[name + "/linear/weights"] = linear_1.weight_shape();
    } else {
        shapes[name + "/linear_1/weights"] = linear_1.weight_shape();
        shapes[name + "/linear_2/weights"] = linear_2.weight_shape();
    }
}

void Readout::compute(
    const Parameters& parameters,
    const IrrepsArray& h)
{
    if (kind == ReadoutKind::linear) {
        linear_1.compute(parameters.values(name + "/linear/weights"), h, {}, output);
        return;
    }
    linear_1.compute(parameters.values(name + "/linear_1/weights"), h, {}, hidden);
    hidden_deriv = IrrepsArray(mlp_irreps, h.num_rows);
    activated = IrrepsArray(mlp_irreps, h.num_rows);
    for (int i=0; i<hidden.array.size(); ++i)
        activation.evaluate_deriv(hidden.array[i], activated.array[i], hidden_deriv.array[i]);
    linear_2.compute(parameters.values(name + "/linear_2/weights"), activated, {}, output);
}

void Readout::reverse(
    const Parameters& parameters,
    const IrrepsArray& output_adj,
    IrrepsArray& h_adj)
{
    if (kind == ReadoutKind::linear) {
        linear_1.reverse(parameters.values(name + "/linear/weights"), output_adj, {}, h_adj);
        return;
    }
    auto activated_adj = IrrepsArray(mlp_irreps, output_adj.num_rows);
    linear_2.reverse(parameters.values(name + "/linear_2/weights"), output_adj, {}, activated_adj);
    for (int i=0; i<activated_adj.array.size(); ++i)
        activated_adj.array[i] *= hidden_deriv.array[i];
    linear_1.reverse(parameters.values(name + "/linear_1/weights"), activated_adj, {}, h_adj);
}
