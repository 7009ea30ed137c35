#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "parameters.hpp"

namespace {

Parameters example_parameters()
{
    Parameters parameters;
    parameters.add("layer_0/interaction/linear_up/weights", {2, 3}, {1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
    parameters.add("node_embedding/embeddings", {2}, {-0.5, 0.25});
    return parameters;
}

}

TEST(Parameters, Access)
{
    const auto parameters = example_parameters();
    EXPECT_EQ(parameters.num_parameters(), 8);
    EXPECT_EQ(parameters.paths(), (std::vector<std::string>{
        "layer_0/interaction/linear_up/weights", "node_embedding/embeddings"}));
    EXPECT_EQ(parameters.values("node_embedding/embeddings")[1], 0.25);
    EXPECT_EQ(parameters.at("layer_0/interaction/linear_up/weights").size(), 6);
    EXPECT_THROW(parameters.at("layer_1/interaction/linear_up/weights"), ShapeMismatchError);

    auto other = parameters;
    EXPECT_THROW(other.add("atomic_energies", {3}, {1.0, 2.0}), ShapeMismatchError);
}

TEST(Parameters, SaveAndLoad)
{
    const auto parameters = example_parameters();
    const auto filename = (std::filesystem::temp_directory_path() / "equimace_parameters.json").string();
    parameters.save(filename);
    const auto loaded = Parameters::load(filename);
    std::filesystem::remove(filename);

    EXPECT_EQ(loaded.paths(), parameters.paths());
    for (const auto& path : parameters.paths()) {
        EXPECT_EQ(loaded.at(path).shape, parameters.at(path).shape);
        EXPECT_EQ(loaded.at(path).values, parameters.at(path).values);
    }
}

TEST(Parameters, Compatibility)
{
    const auto parameters = example_parameters();
    auto shapes = std::map<std::string,std::vector<int>>{
        {"layer_0/interaction/linear_up/weights", {2, 3}},
        {"node_embedding/embeddings", {2}}};
    EXPECT_NO_THROW(parameters.check_compatible(shapes));

    shapes["node_embedding/embeddings"] = {1, 2};
    EXPECT_THROW(parameters.check_compatible(shapes), ShapeMismatchError);

    shapes["node_embedding/embeddings"] = {2};
    shapes["atomic_energies"] = {2};
    EXPECT_THROW(parameters.check_compatible(shapes), ShapeMismatchError);

    shapes.erase("atomic_energies");
    shapes.erase("node_embedding/embeddings");
    EXPECT_THROW(parameters.check_compatible(shapes), ShapeMismatchError);
}

TEST(Parameters, MalformedTree)
{
    auto file = example_parameters().to_json();
    file["node_embedding/embeddings"].erase("shape");
    EXPECT_THROW(Parameters::from_json(file), ShapeMismatchError);

    file = example_parameters().to_json();
    file["node_embedding/embeddings"]["shape"] = {3};
    EXPECT_THROW(Parameters::from_json(file), ShapeMismatchError);
}
