#include <fstream>

#include "activation.hpp"
#include "errors.hpp"

#include "model_config.hpp"

int ModelConfig::num_features() const
{
    return hidden_irreps.count(Irrep(0,1));
}

void ModelConfig::validate() const
{
    if (r_max <= 0.0)
        throw ConfigurationError("r_max must be positive");
    if (num_interactions < 1)
        throw ConfigurationError("num_interactions must be at least 1");
    if (num_species < 1)
        throw ConfigurationError("num_species must be at least 1");
    if (avg_num_neighbors <= 0.0)
        throw ConfigurationError("avg_num_neighbors must be positive");
    if (num_bessel < 1)
        throw ConfigurationError("num_bessel must be at least 1");
    if (max_ell < 0)
        throw ConfigurationError("max_ell must be non-negative");
    if (correlation < 1)
        throw ConfigurationError("correlation must be at least 1");
    if (max_poly_order.has_value() and *max_poly_order < 0)
        throw ConfigurationError("max_poly_order must be non-negative");
    if (num_deriv_in_zero.has_value() != num_deriv_in_one.has_value())
        throw ConfigurationError("num_deriv_in_zero and num_deriv_in_one must be set together");
    if (avg_r_min.has_value() and (*avg_r_min < 0.0 or *avg_r_min >= r_max))
        throw ConfigurationError("avg_r_min must lie in [0, r_max)");
    for (auto n : radial_mlp_hidden)
        if (n < 1)
            throw ConfigurationError("radial_mlp_hidden widths must be positive");

    if (hidden_irreps.size() == 0)
        throw ConfigurationError("hidden_irreps is empty");
    if (not hidden_irreps.has_uniform_multiplicity())
        throw ConfigurationError("All hidden irreps must have the same multiplicity, got "
            + hidden_irreps.to_string());
    if (hidden_irreps.distinct().size() != hidden_irreps.size())
        throw ConfigurationError("hidden_irreps must not repeat an irrep, got " + hidden_irreps.to_string());
    if (num_features() == 0)
        throw ConfigurationError("hidden_irreps must contain scalars (0e), got " + hidden_irreps.to_string());
    for (const auto& block : readout_mlp_irreps)
        if (not block.ir.is_scalar())
            throw ConfigurationError("readout_mlp_irreps must be scalars (0e) only, got "
                + readout_mlp_irreps.to_string());
    if (readout_mlp_irreps.dim() == 0)
        throw ConfigurationError("readout_mlp_irreps is empty");
    if (output_irreps.dim() == 0)
        throw ConfigurationError("output_irreps is empty");

    if (interaction_normalization == InteractionNormalization::epsilon) {
        if (not epsilon.has_value())
            throw ConfigurationError("epsilon normalization requires a value for epsilon");
        if (*epsilon <= 0.0)
            throw ConfigurationError("epsilon must be positive");
    } else if (epsilon.has_value()) {
        throw ConfigurationError("epsilon is set but the interaction normalization is sqrt_avg_num_neighbors");
    }

    // throws for unknown names
    [[maybe_unused]] const auto checked_activation = Activation(activation);

    if (not atomic_energies.empty() and atomic_energies.size() != num_species)
        throw ConfigurationError("atomic_energies has " + std::to_string(atomic_energies.size())
            + " entries, expected num_species=" + std::to_string(num_species));
}

nlohmann::json ModelConfig::to_json() const
{
    nlohmann::json file;
    file["output_irreps"] = output_irreps.to_string();
    file["r_max"] = r_max;
    file["num_interactions"] = num_interactions;
    file["hidden_irreps"] = hidden_irreps.to_string();
    file["readout_mlp_irreps"] = readout_mlp_irreps.to_string();
    file["avg_num_neighbors"] = avg_num_neighbors;
    file["num_species"] = num_species;
    file["num_bessel"] = num_bessel;
    file["num_deriv_in_zero"] = num_deriv_in_zero.has_value() ? nlohmann::json(*num_deriv_in_zero) : nlohmann::json(nullptr);
    file["num_deriv_in_one"] = num_deriv_in_one.has_value() ? nlohmann::json(*num_deriv_in_one) : nlohmann::json(nullptr);
    file["envelope_arg_multiplicator"] = envelope_arg_multiplicator;
    file["envelope_value_at_origin"] = envelope_value_at_origin;
    file["radial_mlp_hidden"] = radial_mlp_hidden;
    file["avg_r_min"] = avg_r_min.has_value() ? nlohmann::json(*avg_r_min) : nlohmann::json(nullptr);
    file["max_ell"] = max_ell;
    file["correlation"] = correlation;
    file["max_poly_order"] = max_poly_order.has_value() ? nlohmann::json(*max_poly_order) : nlohmann::json(nullptr);
    file["activation"] = activation;
    file["interaction_normalization"] =
        (interaction_normalization == InteractionNormalization::epsilon) ? "epsilon" : "sqrt_avg_num_neighbors";
    file["epsilon"] = epsilon.has_value() ? nlohmann::json(*epsilon) : nlohmann::json(nullptr);
    file["learnable_atomic_energies"] = learnable_atomic_energies;
    file["atomic_energies"] = atomic_energies;
    return file;
}

ModelConfig ModelConfig::from_json(const nlohmann::json& file)
{
    auto optional_int = [&file](const std::string& key) -> std::optional<int> {
        if (not file.contains(key) or file[key].is_null())
            return std::nullopt;
        return file[key].get<int>();
    };

    ModelConfig config;
    try {
        if (file.contains("output_irreps"))
            config.output_irreps = Irreps(file["output_irreps"].get<std::string>());
        config.r_max = file.value("r_max", config.r_max);
        config.num_interactions = file.value("num_interactions", config.num_interactions);
        if (file.contains("hidden_irreps"))
            config.hidden_irreps = Irreps(file["hidden_irreps"].get<std::string>());
        if (file.contains("readout_mlp_irreps"))
            config.readout_mlp_irreps = Irreps(file["readout_mlp_irreps"].get<std::string>());
        config.avg_num_neighbors = file.value("avg_num_neighbors", config.avg_num_neighbors);
        config.num_species = file.value("num_species", config.num_species);
        config.num_bessel = file.value("num_bessel", config.num_bessel);
        config.num_deriv_in_zero = optional_int("num_deriv_in_zero");
        config.num_deriv_in_one = optional_int("num_deriv_in_one");
        config.envelope_arg_multiplicator = file.value("envelope_arg_multiplicator", config.envelope_arg_multiplicator);
        config.envelope_value_at_origin = file.value("envelope_value_at_origin", config.envelope_value_at_origin);
        if (file.contains("radial_mlp_hidden"))
            config.radial_mlp_hidden = file["radial_mlp_hidden"].get<std::vector<int>>();
        if (file.contains("avg_r_min") and not file["avg_r_min"].is_null())
            config.avg_r_min = file["avg_r_min"].get<double>();
        config.max_ell = file.value("max_ell", config.max_ell);
        config.correlation = file.value("correlation", config.correlation);
        config.max_poly_order = optional_int("max_poly_order");
        config.activation = file.value("activation", config.activation);

        // epsilon and the normalization policy must agree when both are given
        const bool has_epsilon = file.contains("epsilon") and not file["epsilon"].is_null();
        config.epsilon = has_epsilon ? std::optional<double>(file["epsilon"].get<double>()) : std::nullopt;
        if (file.contains("interaction_normalization")) {
            const auto name = file["interaction_normalization"].get<std::string>();
            if (name == "epsilon")
                config.interaction_normalization = InteractionNormalization::epsilon;
            else if (name == "sqrt_avg_num_neighbors")
                config.interaction_normalization = InteractionNormalization::sqrt_avg_num_neighbors;
            else
                throw ConfigurationError("Unknown interaction_normalization '" + name + "'");
        } else {
            config.interaction_normalization = has_epsilon
                ? InteractionNormalization::epsilon
                : InteractionNormalization::sqrt_avg_num_neighbors;
        }

        config.learnable_atomic_energies = file.value("learnable_atomic_energies", config.learnable_atomic_energies);
        if (file.contains("atomic_energies"))
            config.atomic_energies = file["atomic_energies"].get<std::vector<double>>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid model configuration: ") + e.what());
    }
    config.validate();
    return config;
}

void ModelConfig::save(const std::string& filename) const
{
    std::ofstream f(filename);
    if (not f)
        throw std::runtime_error("Could not open " + filename + " for writing");
    f << to_json().dump(4);
}

ModelConfig ModelConfig::load(const std::string& filename)
{
    std::ifstream f(filename);
    if (not f)
        throw ConfigurationError("Could not open " + filename);
    nlohmann::json file;
    try {
        file = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Could not parse " + filename + ": " + e.what());
    }
    return from_json(file);
}
