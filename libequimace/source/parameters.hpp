#pragma once

#include <map>
#include <span>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

// A shaped block of parameters, stored row-major
struct Tensor {
std::vector<int> shape;
std::vector<double> values;
int size() const;
};

// Parameter tree: sorted mapping from slash-separated layer paths
// (e.g. "layer_1/interaction/linear_down/weights") to tensors.
class Parameters {

public:

std::map<std::string,Tensor> tensors;

void add(const std::string& path, std::vector<int> shape, std::vector<double> values);
bool contains(const std::string& path) const { return tensors.contains(path); }
const Tensor& at(const std::string& path) const;
std::span<const double> values(const std::string& path) const;
std::vector<std::string> paths() const;
int num_parameters() const;

// throws ShapeMismatchError unless both trees have identical paths and shapes
void check_compatible(const std::map<std::string,std::vector<int>>& shapes) const;

nlohmann::json to_json() const;
static Parameters from_json(const nlohmann::json& file);
void save(const std::string& filename) const;
static Parameters load(const std::string& filename);

};
