#include <fstream>
#include <sstream>

#include "errors.hpp"

#include "parameters.hpp"

namespace {

std::string shape_to_string(const std::vector<int>& shape)
{
    std::stringstream stream;
    stream << "(";
    for (int i=0; i<shape.size(); ++i)
        stream << (i > 0 ? "," : "") << shape[i];
    stream << ")";
    return stream.str();
}

}

int Tensor::size() const
{
    int n = 1;
    for (auto s : shape)
        n *= s;
    return n;
}

void Parameters::add(
    const std::string& path,
    std::vector<int> shape,
    std::vector<double> values)
{
    auto tensor = Tensor{shape, values};
    if (tensor.size() != tensor.values.size())
        throw ShapeMismatchError("Parameter " + path + " has shape " + shape_to_string(shape)
            + " but " + std::to_string(values.size()) + " values");
    tensors[path] = std::move(tensor);
}

const Tensor& Parameters::at(const std::string& path) const
{
    auto it = tensors.find(path);
    if (it == tensors.end())
        throw ShapeMismatchError("Missing parameter " + path);
    return it->second;
}

std::span<const double> Parameters::values(const std::string& path) const
{
    const auto& tensor = at(path);
    return std::span<const double>(tensor.values.data(), tensor.values.size());
}

std::vector<std::string> Parameters::paths() const
{
    auto p = std::vector<std::string>();
    for (const auto& [path, tensor] : tensors)
        p.push_back(path);
    return p;
}

int Parameters::num_parameters() const
{
    int n = 0;
    for (const auto& [path, tensor] : tensors)
        n += tensor.values.size();
    return n;
}

void Parameters::check_compatible(
    const std::map<std::string,std::vector<int>>& shapes) const
{
    for (const auto& [path, shape] : shapes) {
        auto it = tensors.find(path);
        if (it == tensors.end())
            throw ShapeMismatchError("Missing parameter " + path);
        if (it->second.shape != shape)
            throw ShapeMismatchError("Parameter " + path + " has shape " + shape_to_string(it->second.shape)
                + ", expected " + shape_to_string(shape));
    }
    for (const auto& [path, tensor] : tensors)
        if (not shapes.contains(path))
            throw ShapeMismatchError("Unexpected parameter " + path);
}

nlohmann::json Parameters::to_json() const
{
    nlohmann::json file = nlohmann::json::object();
    for (const auto& [path, tensor] : tensors) {
        file[path]["shape"] = tensor.shape;
        file[path]["values"] = tensor.values;
    }
    return file;
}

Parameters Parameters::from_json(const nlohmann::json& file)
{
    Parameters parameters;
    try {
        for (const auto& [path, entry] : file.items()) {
            parameters.add(
                path,
                entry.at("shape").get<std::vector<int>>(),
                entry.at("values").get<std::vector<double>>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ShapeMismatchError(std::string("Malformed parameter tree: ") + e.what());
    }
    return parameters;
}

void Parameters::save(const std::string& filename) const
{
    std::ofstream f(filename);
    if (not f)
        throw std::runtime_error("Could not open " + filename + " for writing");
    f << to_json().dump();
}

Parameters Parameters::load(const std::string& filename)
{
    std::ifstream f(filename);
    if (not f)
        throw std::runtime_error("Could not open " + filename);
    nlohmann::json file;
    try {
        file = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ShapeMismatchError("Could not parse " + filename + ": " + e.what());
    }
    return from_json(file);
}
