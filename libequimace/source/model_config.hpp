#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "irreps.hpp"

// How the interaction output is rescaled before the product basis
enum class InteractionNormalization { epsilon, sqrt_avg_num_neighbors };

struct ModelConfig {

Irreps output_irreps = Irreps("0e");
double r_max = 5.0;
int num_interactions = 2;
// multiplicities must all equal the number of features
Irreps hidden_irreps = Irreps("128x0e+128x1o");
Irreps readout_mlp_irreps = Irreps("16x0e");
double avg_num_neighbors = 1.0;
int num_species = 1;

// radial basis; both envelope degrees unset selects the soft envelope
int num_bessel = 8;
std::optional<int> num_deriv_in_zero;
std::optional<int> num_deriv_in_one;
double envelope_arg_multiplicator = 2.0;
double envelope_value_at_origin = 1.2;
std::vector<int> radial_mlp_hidden = {64, 64, 64};
// rescale the radial basis to unit mean square on [avg_r_min, r_max]
std::optional<double> avg_r_min;

int max_ell = 3;
int correlation = 3;
std::optional<int> max_poly_order;
std::string activation = "silu";

InteractionNormalization interaction_normalization = InteractionNormalization::epsilon;
std::optional<double> epsilon = 0.5;

// initial values of learnable atomic energies (zeros if empty)
bool learnable_atomic_energies = false;
std::vector<double> atomic_energies;

int num_features() const;
// throws ConfigurationError
void validate() const;

nlohmann::json to_json() const;
static ModelConfig from_json(const nlohmann::json& file);
void save(const std::string& filename) const;
static ModelConfig load(const std::string& filename);

};
