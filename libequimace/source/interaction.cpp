#include <algorithm>

#include "errors.hpp"

#include "interaction.hpp"

InteractionLayer::InteractionLayer(
    std::string name,
    InteractionKind kind,
    Irreps irreps_in,
    Irreps hidden_irreps,
    int max_ell,
    int num_bessel,
    std::vector<int> radial_mlp_hidden,
    Activation activation,
    int num_species,
    double avg_num_neighbors,
    double output_scale)
    : name(name),
      kind(kind),
      max_ell(max_ell),
      num_lm((max_ell+1)*(max_ell+1)),
      num_bessel(num_bessel),
      num_species(num_species),
      avg_num_neighbors(avg_num_neighbors),
      output_scale(output_scale),
      irreps_in(irreps_in),
      hidden_irreps(hidden_irreps)
{
    if (irreps_in.size() == 0 or not irreps_in.has_uniform_multiplicity())
        throw ConfigurationError(name + ": input irreps " + irreps_in.to_string()
            + " must have a uniform multiplicity");
    num_features = irreps_in[0].mul;
    if (not hidden_irreps.has_uniform_multiplicity() or hidden_irreps[0].mul != num_features)
        throw ConfigurationError(name + ": hidden irreps " + hidden_irreps.to_string()
            + " must all have multiplicity " + std::to_string(num_features));

    // coupling paths (l1,p1) x (l2,(-1)^l2) -> (l3,p1*(-1)^l2) with l3 <= max_ell
    for (int i_in=0; i_in<irreps_in.size(); ++i_in) {
        const auto ir1 = irreps_in[i_in].ir;
        for (int l2=0; l2<=max_ell; ++l2) {
            const auto ir2 = Irrep(l2, (l2 % 2 == 0) ? 1 : -1);
            for (const auto& ir3 : coupled_irreps(ir1, ir2)) {
                if (ir3.l > max_ell)
                    continue;
                paths.push_back({i_in, ir1.l, l2, ir3.l, 0, coupling_entries(ir1.l, l2, ir3.l)});
            }
        }
    }
    if (paths.empty())
        throw ConfigurationError(name + ": no coupling path reaches degree <= " + std::to_string(max_ell));
    auto path_irrep = [](const InteractionPath& path, const Irreps& irreps) {
        const auto& ir1 = irreps[path.i_in].ir;
        return Irrep(path.l3, ir1.p * ((path.l2 % 2 == 0) ? 1 : -1));
    };
    std::stable_sort(paths.begin(), paths.end(),
        [&](const InteractionPath& a, const InteractionPath& b) {
            return path_irrep(a, this->irreps_in) < path_irrep(b, this->irreps_in);
        });
    auto message_blocks = std::vector<MulIrrep>();
    auto out_blocks = std::vector<MulIrrep>();
    for (int p=0; p<paths.size(); ++p) {
        const auto ir3 = path_irrep(paths[p], this->irreps_in);
        paths[p].i_msg = p;
        message_blocks.push_back({num_features, ir3});
        if (out_blocks.empty() or out_blocks.back().ir != ir3)
            out_blocks.push_back({num_features, ir3});
    }
    message_irreps = Irreps(message_blocks);
    irreps_out = Irreps(out_blocks);

    linear_up = Linear(irreps_in, irreps_in);
    linear_down = Linear(message_irreps, irreps_out);
    if (kind == InteractionKind::residual)
        skip_tp = Linear(irreps_in, hidden_irreps, num_species);

    auto shape = std::vector<int>{num_bessel};
    shape.insert(shape.end(), radial_mlp_hidden.begin(), radial_mlp_hidden.end());
    shape.push_back(paths.size()*num_features);
    for (int q=0; q<num_species*(num_species+1)/2; ++q)
        radial_mlps.push_back(MultilayerPerceptron(shape, activation));
}

int InteractionLayer::species_pair(int type_i, int type_j) const
{
    return (type_i <= type_j)
        ? type_i*(2*num_species-type_i-1)/2 + type_j
        : type_j*(2*num_species-type_j-1)/2 + type_i;
}

void InteractionLayer::parameter_shapes(
    std::map<std::string,std::vector<int>>& shapes) const
{
    shapes[name + "/linear_up/weights"] = linear_up.weight_shape();
    shapes[name + "/linear_down/weights"] = linear_down.weight_shape();
    if (kind == InteractionKind::residual)
        shapes[name + "/skip_tp/weights"] = skip_tp.weight_shape();
    for (int q=0; q<radial_mlps.size(); ++q) {
        const auto& shape = radial_mlps[q].shape;
        for (int l=0; l<shape.size()-1; ++l)
            shapes[name + "/radial_mlp/pair_" + std::to_string(q) + "/weights_" + std::to_string(l)] = {shape[l+1], shape[l]};
    }
}

std::vector<std::span<const double>> InteractionLayer::mlp_weights(
    const Parameters& parameters,
    int q) const
{
    auto weights = std::vector<std::span<const double>>();
    for (int l=0; l<radial_mlps[q].shape.size()-1; ++l)
        weights.push_back(parameters.values(
            name + "/radial_mlp/pair_" + std::to_string(q) + "/weights_" + std::to_string(l)));
    return weights;
}

void InteractionLayer::compute_edge_weights(
    const Parameters& parameters,
    std::span<const int> node_types,
    std::span<const int> senders,
    std::span<const int> receivers,
    std::span<const double> R)
{
    const int num_edges = senders.size();
    const int num_weights = paths.size()*num_features;
    pair_edges.assign(radial_mlps.size(), std::vector<int>());
    for (int e=0; e<num_edges; ++e)
        pair_edges[species_pair(node_types[senders[e]], node_types[receivers[e]])].push_back(e);
    edge_weights.resize(num_edges*num_weights);
    for (int q=0; q<radial_mlps.size(); ++q) {
        const auto& edges = pair_edges[q];
        if (edges.empty())
            continue;
        auto R_q = std::vector<double>(edges.size()*num_bessel);
        for (int j=0; j<edges.size(); ++j)
            std::copy(R.begin()+edges[j]*num_bessel, R.begin()+(edges[j]+1)*num_bessel, R_q.begin()+j*num_bessel);
        auto w_q = radial_mlps[q].evaluate_batch(R_q, edges.size(), mlp_weights(parameters, q));
        for (int j=0; j<edges.size(); ++j)
            std::copy(w_q.begin()+j*num_weights, w_q.begin()+(j+1)*num_weights, edge_weights.begin()+edges[j]*num_weights);
    }
}

void InteractionLayer::compute(
    const Parameters& parameters,
    const IrrepsArray& h,
    std::span<const int> node_types,
    std::span<const int> senders,
    std::span<const int> receivers,
    std::span<const double> Y,
    std::span<const double> R)
{
    const int num_nodes = h.num_rows;
    const int num_edges = senders.size();
    const int num_paths = paths.size();
    const int K = num_features;
    if (receivers.size() != num_edges or Y.size() != num_edges*num_lm or R.size() != num_edges*num_bessel)
        throw DomainError(name + ": inconsistent edge arrays");

    if (kind == InteractionKind::residual)
        skip_tp.compute(parameters.values(name + "/skip_tp/weights"), h, node_types, sc);
    linear_up.compute(parameters.values(name + "/linear_up/weights"), h, {}, u);
    compute_edge_weights(parameters, node_types, senders, receivers, R);

    // [m_i]_pm3k = \sum_{j->i} w_pk \sum_{m1,m2} C_m1m2m3 [u_j]_m1k Y_m2
    messages = IrrepsArray(message_irreps, num_nodes);
    for (int e=0; e<num_edges; ++e) {
        const auto Y_e = Y.data()+e*num_lm;
        const auto w_e = edge_weights.data()+e*num_paths*K;
        for (const auto& path : paths) {
            const auto u_j = u.block(senders[e], path.i_in);
            const auto w_ep = w_e+path.i_msg*K;
            auto m_i = messages.block(receivers[e], path.i_msg);
            for (const auto& c : path.entries) {
                const double C_Y = c.value * Y_e[path.l2*path.l2+c.m2];
                const auto u_j_m1 = u_j+c.m1*K;
                auto m_i_m3 = m_i+c.m3*K;
                for (int k=0; k<K; ++k)
                    m_i_m3[k] += C_Y * w_ep[k] * u_j_m1[k];
            }
        }
    }
    for (auto& m : messages.array)
        m /= avg_num_neighbors;

    linear_down.compute(parameters.values(name + "/linear_down/weights"), messages, {}, A);
    for (auto& a : A.array)
        a *= output_scale;
}

void InteractionLayer::reverse(
    const Parameters& parameters,
    const IrrepsArray& A_adj,
    const IrrepsArray* sc_adj,
    std::span<const int> node_types,
    std::span<const int> senders,
    std::span<const int> receivers,
    std::span<const double> Y,
    std::span<const double> R,
    IrrepsArray& h_adj,
    std::vector<double>& Y_adj,
    std::vector<double>& R_adj)
{
    const int num_nodes = A_adj.num_rows;
    const int num_edges = senders.size();
    const int num_paths = paths.size();
    const int K = num_features;

    auto A_adj_scaled = A_adj;
    for (auto& a : A_adj_scaled.array)
        a *= output_scale;
    messages_adj = IrrepsArray(message_irreps, num_nodes);
    linear_down.reverse(parameters.values(name + "/linear_down/weights"), A_adj_scaled, {}, messages_adj);
    for (auto& m : messages_adj.array)
        m /= avg_num_neighbors;

    u_adj = IrrepsArray(irreps_in, num_nodes);
    edge_weights_adj.assign(num_edges*num_paths*K, 0.0);
    Y_adj.assign(num_edges*num_lm, 0.0);
    for (int e=0; e<num_edges; ++e) {
        const auto Y_e = Y.data()+e*num_lm;
        const auto w_e = edge_weights.data()+e*num_paths*K;
        auto w_adj_e = edge_weights_adj.data()+e*num_paths*K;
        auto Y_adj_e = Y_adj.data()+e*num_lm;
        for (const auto& path : paths) {
            const auto u_j = u.block(senders[e], path.i_in);
            auto u_adj_j = u_adj.block(senders[e], path.i_in);
            const auto w_ep = w_e+path.i_msg*K;
            auto w_adj_ep = w_adj_e+path.i_msg*K;
            const auto m_adj_i = messages_adj.block(receivers[e], path.i_msg);
            for (const auto& c : path.entries) {
                const int lm2 = path.l2*path.l2+c.m2;
                const double Y_e_lm2 = Y_e[lm2];
                const auto u_j_m1 = u_j+c.m1*K;
                auto u_adj_j_m1 = u_adj_j+c.m1*K;
                const auto m_adj_i_m3 = m_adj_i+c.m3*K;
                double Y_adj_e_lm2 = 0.0;
                for (int k=0; k<K; ++k) {
                    const double g = c.value * m_adj_i_m3[k];
                    w_adj_ep[k] += g * Y_e_lm2 * u_j_m1[k];
                    u_adj_j_m1[k] += g * Y_e_lm2 * w_ep[k];
                    Y_adj_e_lm2 += g * w_ep[k] * u_j_m1[k];
                }
                Y_adj_e[lm2] += Y_adj_e_lm2;
            }
        }
    }

    // dE/dR through the radial MLPs (recomputing their forward pass)
    const int num_weights = num_paths*K;
    R_adj.assign(num_edges*num_bessel, 0.0);
    compute_edge_weights(parameters, node_types, senders, receivers, R);
    for (int q=0; q<radial_mlps.size(); ++q) {
        const auto& edges = pair_edges[q];
        if (edges.empty())
            continue;
        const auto weights = mlp_weights(parameters, q);
        auto R_q = std::vector<double>(edges.size()*num_bessel);
        auto w_adj_q = std::vector<double>(edges.size()*num_weights);
        for (int j=0; j<edges.size(); ++j) {
            std::copy(R.begin()+edges[j]*num_bessel, R.begin()+(edges[j]+1)*num_bessel, R_q.begin()+j*num_bessel);
            std::copy(edge_weights_adj.begin()+edges[j]*num_weights, edge_weights_adj.begin()+(edges[j]+1)*num_weights,
                      w_adj_q.begin()+j*num_weights);
        }
        radial_mlps[q].evaluate_batch(R_q, edges.size(), weights);
        auto R_adj_q = radial_mlps[q].reverse_batch(w_adj_q, edges.size(), weights);
        for (int j=0; j<edges.size(); ++j)
            std::copy(R_adj_q.begin()+j*num_bessel, R_adj_q.begin()+(j+1)*num_bessel, R_adj.begin()+edges[j]*num_bessel);
    }

    linear_up.reverse(parameters.values(name + "/linear_up/weights"), u_adj, {}, h_adj);
    if (kind == InteractionKind::residual and sc_adj != nullptr)
        skip_tp.reverse(parameters.values(name + "/skip_tp/weights"), *sc_adj, node_types, h_adj);
}
