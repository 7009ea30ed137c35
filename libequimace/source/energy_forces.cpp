#include "errors.hpp"

#include "energy_forces.hpp"

EnergyForceDriver::EnergyForceDriver(ModelConfig config)
    : model(config)
{
    if (model.output_irreps.size() == 0 or not model.output_irreps[0].ir.is_scalar())
        throw ConfigurationError("Energies need a scalar (0e) first output block, got "
            + model.output_irreps.to_string());
}

EnergyForceResult EnergyForceDriver::evaluate(
    const Parameters& parameters,
    const AtomicGraph& graph,
    std::span<const double> atomic_energies,
    double scale,
    double shift)
{
    if (model.config.learnable_atomic_energies)
        throw ConfigurationError("The atomic energies of this model are learnable and live in the parameters");
    if (atomic_energies.size() != model.num_species)
        throw ConfigurationError("Expected " + std::to_string(model.num_species) + " atomic energies, got "
            + std::to_string(atomic_energies.size()));
    return compute(parameters, graph, atomic_energies, scale, shift);
}

EnergyForceResult EnergyForceDriver::evaluate(
    const Parameters& parameters,
    const AtomicGraph& graph,
    double scale,
    double shift)
{
    if (not model.config.learnable_atomic_energies)
        throw ConfigurationError("This model has fixed atomic energies, pass them explicitly");
    return compute(parameters, graph, parameters.values("atomic_energies"), scale, shift);
}

EnergyForceResult EnergyForceDriver::compute(
    const Parameters& parameters,
    const AtomicGraph& graph,
    std::span<const double> atomic_energies,
    double scale,
    double shift)
{
    graph.validate();
    const int num_nodes = graph.num_nodes();
    const int num_layers = model.num_layers;
    const int D = model.output_irreps.dim();

    const auto vectors = graph.edge_vectors();
    const auto& contributions = model.forward(
        parameters, vectors, graph.species, graph.senders, graph.receivers, graph.edge_mask, graph.node_mask);

    // only nodes of valid graphs contribute to the total energy
    const auto g_of_i = graph.node_graph();
    auto contributes = std::vector<bool>(num_nodes);
    for (int i=0; i<num_nodes; ++i)
        contributes[i] = graph.node_valid(i) and graph.graph_valid(g_of_i[i]);

    EnergyForceResult result;
    result.node_energies.assign(num_nodes, 0.0);
    result.graph_energies.assign(graph.num_graphs(), 0.0);
    result.forces.assign(3*num_nodes, 0.0);
    auto contributions_adj = std::vector<double>(contributions.size(), 0.0);
    for (int i=0; i<num_nodes; ++i) {
        if (not contributes[i])
            continue;
        double E_i = atomic_energies[graph.species[i]] + shift;
        for (int t=0; t<num_layers; ++t) {
            E_i += scale * contributions[(i*num_layers+t)*D];
            contributions_adj[(i*num_layers+t)*D] = scale;
        }
        result.node_energies[i] = E_i;
        result.graph_energies[g_of_i[i]] += E_i;
    }

    // F = -dE/dpos with vector = pos[receiver] - pos[sender] + shift
    const auto vectors_adj = model.reverse(parameters, contributions_adj);
    for (int e=0; e<graph.num_edges(); ++e) {
        const int i = graph.receivers[e];
        const int j = graph.senders[e];
        for (int a=0; a<3; ++a) {
            result.forces[3*i+a] -= vectors_adj[3*e+a];
            result.forces[3*j+a] += vectors_adj[3*e+a];
        }
    }
    for (int i=0; i<num_nodes; ++i)
        if (not graph.node_valid(i))
            for (int a=0; a<3; ++a)
                result.forces[3*i+a] = 0.0;
    return result;
}
