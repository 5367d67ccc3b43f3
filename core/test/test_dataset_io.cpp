#include "test.hpp"

#include "stvox/core/io/DatasetIO.hpp"
#include "stvox/core/util/Color.hpp"
#include "stvox/core/util/LoadJson.hpp"
#include "stvox/core/util/Logging.hpp"
#include "stvox/core/util/TestDataset.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace stvox;
using Json = nlohmann::json;

namespace {

Json selectionExport()
{
    return Json::parse(R"({
        "bounds": {"left": 0, "right": 1000, "top": 0, "bottom": 800, "depth": 120, "note": "pixels"},
        "spots": {"count": 2, "data": [
            {"gene": "ACTB", "x": 12.5, "y": 40.25, "z": 3.0, "plane_id": 0,
             "spot_id": "plane0_spot_000", "parent_cell_id": 4,
             "parent_cell_X": 13.0, "parent_cell_Y": 41.0, "parent_cell_Z": 2.5},
            {"gene": "VIM", "x": 99, "y": 101, "z": 50, "plane_id": 2,
             "spot_id": 17, "parent_cell_id": null,
             "parent_cell_X": null, "parent_cell_Y": null, "parent_cell_Z": null}
        ]},
        "cells": {"count": 2, "data": [
            {"cellId": 4, "plane": 0, "clippedBoundary": [[0, 0], [10, 0], [10, 10], [0, 0]],
             "cellColor": "#ff8000"},
            {"cell_id": 5, "plane": 1, "clippedBoundary": [[1, 1], [2, 2], [3, 1]],
             "cellColor": [10, 20, 30]}
        ]}
    })");
}

}  // namespace

// --- colors ------------------------------------------------------------------

TEST(HexColor, ParsesLongShortAndBareForms)
{
    EXPECT_EQ(*parseHexColor("#ff8000"), cv::Vec3b(255, 128, 0));
    EXPECT_EQ(*parseHexColor("FF8000"), cv::Vec3b(255, 128, 0));
    EXPECT_EQ(*parseHexColor("#f80"), cv::Vec3b(255, 136, 0));
    EXPECT_EQ(*parseHexColor("  #0a0B0c "), cv::Vec3b(10, 11, 12));
}

TEST(HexColor, RejectsMalformed)
{
    EXPECT_FALSE(parseHexColor("").has_value());
    EXPECT_FALSE(parseHexColor("#12345").has_value());
    EXPECT_FALSE(parseHexColor("#gg0000").has_value());
    EXPECT_FALSE(parseHexColor("red").has_value());
}

TEST(HexColor, FormatsLowercase)
{
    EXPECT_EQ(toHexColor(cv::Vec3b(255, 128, 0)), "#ff8000");
    EXPECT_EQ(toHexColor(cv::Vec3b(0, 0, 255)), "#0000ff");
}

TEST(GeneColorTable, FallbackForUnknownGenes)
{
    GeneColorTable table;
    table.set("ACTB", cv::Vec3b(1, 2, 3));
    EXPECT_EQ(table.colorFor("ACTB"), cv::Vec3b(1, 2, 3));
    EXPECT_EQ(table.colorFor("GAPDH"), cv::Vec3b(0, 0, 255));
    EXPECT_TRUE(table.contains("ACTB"));
    EXPECT_FALSE(table.contains("GAPDH"));
}

// --- dataset -----------------------------------------------------------------

TEST(DatasetIO, ReadsSelectionExport)
{
    const Dataset d = io::datasetFromJson(selectionExport());

    EXPECT_FLOAT_EQ(d.bounds.right, 1000.0f);
    EXPECT_FLOAT_EQ(d.bounds.depth, 120.0f);

    ASSERT_EQ(d.spots.size(), 2u);
    const GeneSpot& a = d.spots[0];
    EXPECT_EQ(a.gene, "ACTB");
    EXPECT_FLOAT_EQ(a.y, 40.25f);
    EXPECT_EQ(a.planeId, 0);
    EXPECT_EQ(a.spotId, "plane0_spot_000");
    ASSERT_TRUE(a.parentCellId.has_value());
    EXPECT_EQ(*a.parentCellId, 4);
    EXPECT_TRUE(a.hasCompleteParent());

    const GeneSpot& b = d.spots[1];
    EXPECT_EQ(b.spotId, "17");
    EXPECT_FALSE(b.parentCellId.has_value());
    EXPECT_FALSE(b.parentX.has_value());

    ASSERT_EQ(d.cells.size(), 2u);
    EXPECT_EQ(d.cells[0].cellId, 4);
    EXPECT_EQ(d.cells[0].vertices.size(), 4u);
    EXPECT_EQ(*d.cells[0].fillColor, cv::Vec3b(255, 128, 0));
    EXPECT_EQ(d.cells[1].cellId, 5);
    EXPECT_EQ(d.cells[1].planeId, 1);
    EXPECT_EQ(*d.cells[1].fillColor, cv::Vec3b(10, 20, 30));
}

TEST(DatasetIO, AcceptsBareArrays)
{
    Json j = selectionExport();
    j["spots"] = j["spots"]["data"];
    j["cells"] = j["cells"]["data"];
    const Dataset d = io::datasetFromJson(j);
    EXPECT_EQ(d.spots.size(), 2u);
    EXPECT_EQ(d.cells.size(), 2u);
}

TEST(DatasetIO, MissingSectionsAreEmpty)
{
    const Dataset d = io::datasetFromJson(Json::parse(
        R"({"bounds": {"left": 0, "right": 5, "top": 0, "bottom": 5}})"));
    EXPECT_TRUE(d.spots.empty());
    EXPECT_TRUE(d.cells.empty());
    EXPECT_FLOAT_EQ(d.bounds.depth, 0.0f);
}

TEST(DatasetIO, CellWithoutBoundaryKeepsEmptyVertices)
{
    Json j = selectionExport();
    j["cells"]["data"][0].erase("clippedBoundary");
    const Dataset d = io::datasetFromJson(j);
    EXPECT_TRUE(d.cells[0].vertices.empty());
}

TEST(DatasetIO, MalformedInputThrows)
{
    EXPECT_THROW(io::datasetFromJson(Json::object()), std::runtime_error);

    Json noGene = selectionExport();
    noGene["spots"]["data"][0].erase("gene");
    EXPECT_THROW(io::datasetFromJson(noGene), std::runtime_error);

    Json badVertex = selectionExport();
    badVertex["cells"]["data"][0]["clippedBoundary"][1] = "oops";
    EXPECT_THROW(io::datasetFromJson(badVertex), std::runtime_error);

    Json badSpots = selectionExport();
    badSpots["spots"] = 5;
    EXPECT_THROW(io::datasetFromJson(badSpots), std::runtime_error);
}

TEST(DatasetIO, GeneratedDatasetSurvivesJson)
{
    const Dataset d = generateTestDataset(3);
    const Dataset back = io::datasetFromJson(io::toJson(d));

    ASSERT_EQ(back.spots.size(), d.spots.size());
    ASSERT_EQ(back.cells.size(), d.cells.size());
    EXPECT_EQ(back.spots[0].spotId, d.spots[0].spotId);
    EXPECT_EQ(back.cells[0].vertices.size(), d.cells[0].vertices.size());
    EXPECT_EQ(*back.cells[0].fillColor, *d.cells[0].fillColor);
}

TEST(DatasetIO, LoadsFromFile)
{
    SetLogLevel("warn");
    const auto path = std::filesystem::temp_directory_path() / "stvox_test_dataset.json";
    {
        std::ofstream out(path);
        out << selectionExport().dump();
    }
    const Dataset d = io::loadDataset(path);
    EXPECT_EQ(d.spots.size(), 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(io::loadDataset(path), std::runtime_error);
}

// --- configuration -----------------------------------------------------------

TEST(VoxelConfigIO, BothKeysOptional)
{
    const VoxelConfig full = io::voxelConfigFromJson(Json::parse(R"({"voxelSize": [0.5, 0.5, 1.5], "totalPlanes": 6})"));
    ASSERT_TRUE(full.voxelSize.has_value());
    EXPECT_FLOAT_EQ((*full.voxelSize)[2], 1.5f);
    EXPECT_EQ(*full.totalPlanes, 6);

    const VoxelConfig none = io::voxelConfigFromJson(Json::object());
    EXPECT_FALSE(none.voxelSize.has_value());
    EXPECT_FALSE(none.totalPlanes.has_value());

    EXPECT_THROW(io::voxelConfigFromJson(Json::parse(R"({"voxelSize": [1, 2]})")), std::runtime_error);
}

TEST(GeneColorsIO, ObjectAndGlyphArrayForms)
{
    SetLogLevel("error");
    const GeneColorTable obj = io::geneColorsFromJson(Json::parse(
        R"({"ACTB": "#ff0000", "VIM": [0, 255, 0], "BAD": "nope"})"));
    EXPECT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.colorFor("VIM"), cv::Vec3b(0, 255, 0));

    const GeneColorTable arr = io::geneColorsFromJson(Json::parse(
        R"([{"gene": "CD68", "color": "#00ff00"}, {"gene": "KRT19", "color": "#123456"}])"));
    EXPECT_EQ(arr.size(), 2u);
    EXPECT_EQ(arr.colorFor("KRT19"), cv::Vec3b(0x12, 0x34, 0x56));

    EXPECT_THROW(io::geneColorsFromJson(Json(3)), std::runtime_error);
}

TEST(DisplayOptionsIO, DefaultsForMissingKeys)
{
    const DisplayOptions o = io::displayOptionsFromJson(Json::parse(R"({"showCellInterior": true, "showGhosting": false})"));
    EXPECT_TRUE(o.showCellInterior);
    EXPECT_FALSE(o.showGhosting);
    EXPECT_TRUE(o.showBackground);
    EXPECT_FALSE(o.showBoundary);
    EXPECT_TRUE(o.showLinks);
}

TEST(JsonHelpers, NumberAndStringFallbacks)
{
    const Json j = Json::parse(R"({"a": 2.5, "b": "7", "c": "x", "d": true})");
    EXPECT_FLOAT_EQ(stvox::json::number_or(&j, "a", 0.0), 2.5);
    EXPECT_FLOAT_EQ(stvox::json::number_or(&j, "b", 0.0), 7.0);
    EXPECT_FLOAT_EQ(stvox::json::number_or(&j, "c", 1.0), 1.0);
    EXPECT_FLOAT_EQ(stvox::json::number_or(&j, "missing", 3.0), 3.0);
    EXPECT_EQ(stvox::json::string_or(&j, "c", "def"), "x");
    EXPECT_EQ(stvox::json::string_or(&j, "a", "def"), "def");
    EXPECT_TRUE(stvox::json::bool_or(&j, "d", false));
    EXPECT_THROW(stvox::json::require_fields(j, {"a", "z"}, "helpers"), std::runtime_error);
}

// --- output ------------------------------------------------------------------

TEST(OutputJson, PartitionAndLayers)
{
    SlicePartition p;
    p.sliceY = 2.0f;
    Voxel v;
    v.gridX = 1;
    v.gridY = 2.0f;
    v.gridZ = 3;
    v.category = VoxelCategory::CellInterior;
    v.color = cv::Vec3b(9, 8, 7);
    v.sourceId = 42;
    p.cellInterior.solid.push_back(v);

    const Json j = io::toJson(p);
    ASSERT_EQ(j["cellInterior"]["solid"].size(), 1u);
    const Json& jv = j["cellInterior"]["solid"][0];
    EXPECT_EQ(jv["x"].get<int>(), 1);
    EXPECT_EQ(jv["z"].get<int>(), 3);
    EXPECT_EQ(jv["category"].get<std::string>(), "cell");
    EXPECT_EQ(jv["sourceId"].get<int64_t>(), 42);
    EXPECT_EQ(jv["color"][0].get<int>(), 9);
    EXPECT_TRUE(j["genes"]["ghost"].empty());

    const Json layers = io::toJson(planLayers(p, DisplayOptions{}));
    ASSERT_EQ(layers.size(), 1u);
    EXPECT_EQ(layers[0]["id"].get<std::string>(), "cells-solid");
    EXPECT_FALSE(layers[0]["visible"].get<bool>());
}
