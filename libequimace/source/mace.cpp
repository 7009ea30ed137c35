#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

#include "errors.hpp"
#include "spherical_harmonic.hpp"

#include "mace.hpp"

namespace {

const ModelConfig& validated(const ModelConfig& config)
{
    config.validate();
    return config;
}

}

MACE::MACE(ModelConfig config)
    : config(validated(config)),
      radial_embedding(
          config.r_max,
          config.num_bessel,
          config.num_deriv_in_zero,
          config.num_deriv_in_one,
          config.envelope_arg_multiplicator,
          config.envelope_value_at_origin,
          config.avg_r_min),
      num_nodes(0),
      num_input_edges(0)
{
    num_features = config.num_features();
    num_species = config.num_species;
    num_layers = config.num_interactions;
    r_max = config.r_max;
    max_ell = config.max_ell;
    num_lm = (max_ell+1)*(max_ell+1);
    hidden_irreps = config.hidden_irreps;
    sh_irreps = Irreps::spherical_harmonics(max_ell);
    output_irreps = config.output_irreps;

    const auto activation = Activation(config.activation);
    const double output_scale = (config.interaction_normalization == InteractionNormalization::epsilon)
        ? *config.epsilon
        : 1.0/std::sqrt(config.avg_num_neighbors);

    auto irreps_in = Irreps(std::vector<MulIrrep>{{num_features, Irrep(0,1)}});
    int poly_order = 0;
    for (int t=0; t<num_layers; ++t) {
        const auto name = layer_name(t);
        interactions.emplace_back(
            name + "/interaction",
            (t == 0) ? InteractionKind::first : InteractionKind::residual,
            irreps_in,
            hidden_irreps,
            max_ell,
            config.num_bessel,
            config.radial_mlp_hidden,
            activation,
            num_species,
            config.avg_num_neighbors,
            output_scale);
        symmetric_contractions.emplace_back(
            interactions.back().irreps_out,
            hidden_irreps,
            config.correlation,
            num_species,
            max_ell,
            poly_order,
            config.max_poly_order);
        poly_order = symmetric_contractions.back().output_poly_order;
        poly_orders.push_back(poly_order);
        product_linears.emplace_back(hidden_irreps, hidden_irreps);
        if (t < num_layers-1)
            readouts.emplace_back(name + "/readout", ReadoutKind::linear, hidden_irreps, output_irreps);
        else
            readouts.emplace_back(name + "/readout", ReadoutKind::nonlinear, hidden_irreps, output_irreps,
                                  config.readout_mlp_irreps, activation);
        irreps_in = hidden_irreps;
    }

    shapes["node_embedding/embeddings"] = {num_species, num_features};
    for (int t=0; t<num_layers; ++t) {
        interactions[t].parameter_shapes(shapes);
        shapes[layer_name(t) + "/product_basis/symmetric_contraction/weights"] = symmetric_contractions[t].weight_shape();
        shapes[layer_name(t) + "/product_basis/linear/weights"] = product_linears[t].weight_shape();
        readouts[t].parameter_shapes(shapes);
    }
    if (config.learnable_atomic_energies)
        shapes["atomic_energies"] = {num_species};
}

std::string MACE::layer_name(int t) const
{
    return "layer_" + std::to_string(t);
}

Parameters MACE::init(std::uint64_t seed) const
{
    auto generator = std::mt19937_64(seed);
    auto normal = std::normal_distribution<double>(0.0, 1.0);
    Parameters parameters;
    for (const auto& [path, shape] : shapes) {
        int size = 1;
        for (auto s : shape)
            size *= s;
        auto values = std::vector<double>(size, 0.0);
        if (path == "atomic_energies") {
            if (not config.atomic_energies.empty())
                values = config.atomic_energies;
        } else {
            for (auto& v : values)
                v = normal(generator);
        }
        parameters.add(path, shape, values);
    }
    return parameters;
}

Parameters MACE::init(std::uint64_t seed, const AtomicGraph& template_graph)
{
    template_graph.validate();
    auto parameters = init(seed);
    forward(parameters, template_graph.edge_vectors(), template_graph.species,
            template_graph.senders, template_graph.receivers,
            template_graph.edge_mask, template_graph.node_mask);
    return parameters;
}

Parameters MACE::reload_parameters(const Parameters& parameters) const
{
    parameters.check_compatible(shapes);
    return parameters;
}

Parameters MACE::reload_parameters(const std::string& filename) const
{
    return reload_parameters(Parameters::load(filename));
}

void MACE::compute_edges(
    std::span<const double> vectors,
    std::span<const int> node_species,
    std::span<const int> senders,
    std::span<const int> receivers,
    const std::vector<bool>& edge_mask,
    const std::vector<bool>& node_mask)
{
    num_nodes = node_species.size();
    num_input_edges = senders.size();
    if (receivers.size() != num_input_edges or vectors.size() != 3*num_input_edges)
        throw DomainError("MACE: vectors, senders and receivers must describe the same edges");
    if (not edge_mask.empty() and edge_mask.size() != num_input_edges)
        throw DomainError("MACE: edge_mask has the wrong length");
    if (not node_mask.empty() and node_mask.size() != num_nodes)
        throw DomainError("MACE: node_mask has the wrong length");

    // masked nodes are evaluated as species 0 and never touched by an edge
    node_types.resize(num_nodes);
    for (int i=0; i<num_nodes; ++i) {
        const bool valid = node_mask.empty() or node_mask[i];
        if (valid and (node_species[i] < 0 or node_species[i] >= num_species))
            throw DomainError("MACE: node " + std::to_string(i) + " has species " + std::to_string(node_species[i])
                + ", expected 0 <= species < " + std::to_string(num_species));
        node_types[i] = valid ? node_species[i] : 0;
    }

    edge_index.clear();
    edge_senders.clear();
    edge_receivers.clear();
    edge_xyz.clear();
    edge_r.clear();
    for (int e=0; e<num_input_edges; ++e) {
        if (not edge_mask.empty() and not edge_mask[e])
            continue;
        const int j = senders[e];
        const int i = receivers[e];
        if (j < 0 or j >= num_nodes or i < 0 or i >= num_nodes)
            throw DomainError("MACE: edge " + std::to_string(e) + " refers to a missing node");
        if (not node_mask.empty() and (not node_mask[i] or not node_mask[j]))
            continue;
        const double r = std::sqrt(vectors[3*e]*vectors[3*e] + vectors[3*e+1]*vectors[3*e+1] + vectors[3*e+2]*vectors[3*e+2]);
        if (r < min_edge_length)
            throw DomainError("MACE: edge " + std::to_string(e) + " (" + std::to_string(j) + " -> "
                + std::to_string(i) + ") is too short");
        edge_index.push_back(e);
        edge_senders.push_back(j);
        edge_receivers.push_back(i);
        edge_xyz.insert(edge_xyz.end(), vectors.begin()+3*e, vectors.begin()+3*e+3);
        edge_r.push_back(r);
    }
}

void MACE::compute_node_embedding(const Parameters& parameters)
{
    const auto W = parameters.values("node_embedding/embeddings");
    H[0] = IrrepsArray(Irreps(std::vector<MulIrrep>{{num_features, Irrep(0,1)}}), num_nodes);
    for (int i=0; i<num_nodes; ++i)
        std::copy(W.begin()+node_types[i]*num_features, W.begin()+(node_types[i]+1)*num_features, H[0].row(i));
}

const std::vector<double>& MACE::forward(
    const Parameters& parameters,
    std::span<const double> vectors,
    std::span<const int> node_species,
    std::span<const int> senders,
    std::span<const int> receivers,
    const std::vector<bool>& edge_mask,
    const std::vector<bool>& node_mask)
{
    parameters.check_compatible(shapes);
    compute_edges(vectors, node_species, senders, receivers, edge_mask, node_mask);

    compute_Y(max_ell, edge_xyz, Y, Y_grad);
    radial_embedding.compute_R(edge_r, R, R_deriv);

    H.assign(num_layers+1, IrrepsArray());
    B.assign(num_layers, IrrepsArray());
    compute_node_embedding(parameters);

    const int D = output_irreps.dim();
    contributions.assign(num_nodes*num_layers*D, 0.0);
    for (int t=0; t<num_layers; ++t) {
        const auto name = layer_name(t);
        auto& interaction = interactions[t];
        interaction.compute(parameters, H[t], node_types, edge_senders, edge_receivers, Y, R);
        symmetric_contractions[t].compute(
            parameters.values(name + "/product_basis/symmetric_contraction/weights"),
            interaction.A, node_types, B[t]);
        product_linears[t].compute(parameters.values(name + "/product_basis/linear/weights"), B[t], {}, H[t+1]);
        if (interaction.kind == InteractionKind::residual)
            for (int n=0; n<H[t+1].array.size(); ++n)
                H[t+1].array[n] += interaction.sc.array[n];
        readouts[t].compute(parameters, H[t+1]);
        for (int i=0; i<num_nodes; ++i)
            std::copy(readouts[t].output.row(i), readouts[t].output.row(i)+D, contributions.data()+(i*num_layers+t)*D);
    }
    return contributions;
}

std::vector<double> MACE::reverse(
    const Parameters& parameters,
    std::span<const double> contributions_adj)
{
    const int D = output_irreps.dim();
    if (contributions_adj.size() != num_nodes*num_layers*D)
        throw DomainError("MACE: expected " + std::to_string(num_nodes*num_layers*D)
            + " contribution adjoints, got " + std::to_string(contributions_adj.size()));
    const int num_edges = edge_index.size();
    const int num_bessel = radial_embedding.num_bessel;

    H_adj.assign(num_layers+1, IrrepsArray());
    H_adj[num_layers] = IrrepsArray(hidden_irreps, num_nodes);
    Y_adj.assign(num_edges*num_lm, 0.0);
    R_adj.assign(num_edges*num_bessel, 0.0);
    auto Y_adj_t = std::vector<double>();
    auto R_adj_t = std::vector<double>();
    for (int t=num_layers-1; t>=0; --t) {
        const auto name = layer_name(t);
        auto& interaction = interactions[t];

        auto output_adj = IrrepsArray(output_irreps, num_nodes);
        for (int i=0; i<num_nodes; ++i)
            std::copy(contributions_adj.begin()+(i*num_layers+t)*D, contributions_adj.begin()+(i*num_layers+t+1)*D,
                      output_adj.row(i));
        readouts[t].reverse(parameters, output_adj, H_adj[t+1]);

        auto B_adj = IrrepsArray();
        product_linears[t].reverse(parameters.values(name + "/product_basis/linear/weights"), H_adj[t+1], {}, B_adj);
        auto A_adj = IrrepsArray();
        symmetric_contractions[t].reverse(
            parameters.values(name + "/product_basis/symmetric_contraction/weights"),
            interaction.A, B_adj, node_types, A_adj);

        H_adj[t] = IrrepsArray(H[t].irreps, num_nodes);
        interaction.reverse(
            parameters, A_adj,
            (interaction.kind == InteractionKind::residual) ? &H_adj[t+1] : nullptr,
            node_types, edge_senders, edge_receivers, Y, R,
            H_adj[t], Y_adj_t, R_adj_t);
        for (int n=0; n<Y_adj.size(); ++n)
            Y_adj[n] += Y_adj_t[n];
        for (int n=0; n<R_adj.size(); ++n)
            R_adj[n] += R_adj_t[n];
    }

    // chain rule through r = |xyz| and Y(xyz)
    auto vectors_adj = std::vector<double>(3*num_input_edges, 0.0);
    for (int e=0; e<num_edges; ++e) {
        double r_adj = 0.0;
        for (int n=0; n<num_bessel; ++n)
            r_adj += R_adj[e*num_bessel+n] * R_deriv[e*num_bessel+n];
        for (int a=0; a<3; ++a) {
            double xyz_adj = r_adj * edge_xyz[3*e+a] / edge_r[e];
            const auto Y_grad_ea = Y_grad.data() + (3*e+a)*num_lm;
            const auto Y_adj_e = Y_adj.data() + e*num_lm;
            for (int lm=0; lm<num_lm; ++lm)
                xyz_adj += Y_adj_e[lm] * Y_grad_ea[lm];
            vectors_adj[3*edge_index[e]+a] = xyz_adj;
        }
    }
    return vectors_adj;
}

void MACE::log_summary(std::ostream& os) const
{
    int num_parameters = 0;
    for (const auto& [path, shape] : shapes) {
        int size = 1;
        for (auto s : shape)
            size *= s;
        num_parameters += size;
    }
    os << "MACE model" << std::endl;
    os << "  num_features: " << num_features << std::endl;
    os << "  num_species: " << num_species << std::endl;
    os << "  r_max: " << r_max << std::endl;
    os << "  radial envelope: " << radial_embedding.envelope.to_string()
       << ", num_bessel: " << radial_embedding.num_bessel << std::endl;
    os << "  hidden irreps: " << hidden_irreps.to_string() << std::endl;
    os << "  sh irreps: " << sh_irreps.to_string() << std::endl;
    os << "  output irreps: " << output_irreps.to_string() << std::endl;
    for (int t=0; t<num_layers; ++t) {
        const auto& sc = symmetric_contractions[t];
        os << "  " << layer_name(t) << ":"
           << " interaction " << interactions[t].irreps_in.to_string() << " -> " << interactions[t].irreps_out.to_string()
           << " (" << interactions[t].paths.size() << " paths),"
           << " product basis";
        for (int b=0; b<sc.irreps_out.size(); ++b)
            os << " " << sc.irreps_out[b].ir.to_string() << ":" << sc.num_basis[b];
        os << ", poly order " << poly_orders[t] << std::endl;
    }
    os << "  number of parameters: " << num_parameters << std::endl;
}

MACE build_model(const std::string& filename)
{
    return build_model(ModelConfig::load(filename));
}

MACE build_model(ModelConfig config)
{
    return MACE(std::move(config));
}
