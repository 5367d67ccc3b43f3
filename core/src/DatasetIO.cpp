#include "stvox/core/io/DatasetIO.hpp"
#include "stvox/core/util/LoadJson.hpp"
#include "stvox/core/util/Logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace stvox::io {

using json = nlohmann::json;
namespace jsonutil = stvox::json;

namespace {

float requireNumber(const json& j, const char* key, const std::string& context)
{
    auto v = jsonutil::optional_number(&j, key);
    if (!v) {
        throw std::runtime_error(context + " field '" + std::string(key) + "' must be a number");
    }
    return static_cast<float>(*v);
}

std::optional<float> optionalFloat(const json& j, const char* key)
{
    auto v = jsonutil::optional_number(&j, key);
    if (!v) return std::nullopt;
    return static_cast<float>(*v);
}

std::optional<cv::Vec3b> colorFromJson(const json& c)
{
    if (c.is_string()) {
        return parseHexColor(c.get<std::string>());
    }
    if (c.is_array() && c.size() >= 3 && c[0].is_number() && c[1].is_number() && c[2].is_number()) {
        cv::Vec3b rgb;
        for (int i = 0; i < 3; ++i) {
            rgb[i] = static_cast<uint8_t>(std::clamp(std::lround(c[i].get<double>()), 0L, 255L));
        }
        return rgb;
    }
    return std::nullopt;
}

json colorToJson(const cv::Vec3b& c)
{
    return json::array({c[0], c[1], c[2]});
}

// {"data": [...]} or a bare array; absent means no records
const json& recordArray(const json& root, const char* key)
{
    static const json kEmpty = json::array();
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) return kEmpty;
    if (it->is_array()) return *it;
    if (it->is_object()) {
        auto data = it->find("data");
        if (data != it->end() && data->is_array()) return *data;
        if (data == it->end()) return kEmpty;
    }
    throw std::runtime_error(std::string("dataset field '") + key + "' must be an array or {\"data\": [...]}");
}

GeneSpot spotFromJson(const json& s, size_t index)
{
    const std::string context = "spot " + std::to_string(index);
    jsonutil::require_fields(s, {"gene", "x", "y"}, context);
    if (!s["gene"].is_string()) {
        throw std::runtime_error(context + " field 'gene' must be a string");
    }

    GeneSpot spot;
    spot.gene = s["gene"].get<std::string>();
    spot.x = requireNumber(s, "x", context);
    spot.y = requireNumber(s, "y", context);
    spot.z = static_cast<float>(jsonutil::number_or(&s, "z", 0.0));

    const json* plane = jsonutil::find_any(s, {"plane_id", "planeId", "plane"});
    if (!plane || !plane->is_number()) {
        throw std::runtime_error(context + " has no numeric plane_id");
    }
    spot.planeId = static_cast<int>(plane->get<double>());

    if (const json* id = jsonutil::find_any(s, {"spot_id", "spotId"})) {
        if (id->is_string())
            spot.spotId = id->get<std::string>();
        else if (id->is_number_integer())
            spot.spotId = std::to_string(id->get<int64_t>());
        else
            spot.spotId = id->dump();
    } else {
        spot.spotId = std::to_string(index);
    }

    if (auto parent = jsonutil::optional_number(&s, "parent_cell_id")) {
        spot.parentCellId = static_cast<int>(*parent);
    }
    spot.parentX = optionalFloat(s, "parent_cell_X");
    spot.parentY = optionalFloat(s, "parent_cell_Y");
    spot.parentZ = optionalFloat(s, "parent_cell_Z");
    return spot;
}

CellBoundary cellFromJson(const json& c, size_t index)
{
    const std::string context = "cell " + std::to_string(index);
    if (!c.is_object()) {
        throw std::runtime_error(context + " is not a JSON object");
    }

    CellBoundary cell;
    const json* id = jsonutil::find_any(c, {"cellId", "cell_id"});
    if (!id || !id->is_number()) {
        throw std::runtime_error(context + " has no numeric cellId");
    }
    cell.cellId = static_cast<int>(id->get<double>());

    const json* plane = jsonutil::find_any(c, {"plane", "plane_id", "planeId"});
    if (!plane || !plane->is_number()) {
        throw std::runtime_error(context + " has no numeric plane");
    }
    cell.planeId = static_cast<int>(plane->get<double>());

    auto boundary = c.find("clippedBoundary");
    if (boundary != c.end() && boundary->is_array()) {
        cell.vertices.reserve(boundary->size());
        for (const auto& v : *boundary) {
            if (v.is_array() && v.size() >= 2 && v[0].is_number() && v[1].is_number()) {
                cell.vertices.emplace_back(v[0].get<float>(), v[1].get<float>());
            } else if (v.is_object() && v.contains("x") && v.contains("y")) {
                cell.vertices.emplace_back(requireNumber(v, "x", context), requireNumber(v, "y", context));
            } else {
                throw std::runtime_error(context + " has a malformed boundary vertex: " + v.dump());
            }
        }
    }

    if (auto color = c.find("cellColor"); color != c.end() && !color->is_null()) {
        cell.fillColor = colorFromJson(*color);
        if (!cell.fillColor) {
            Logger()->warn("Ignoring unreadable color {} of cell {}", color->dump(), cell.cellId);
        }
    }
    return cell;
}

}  // namespace

Dataset datasetFromJson(const json& j)
{
    jsonutil::require_fields(j, {"bounds"}, "dataset");
    const json& b = j["bounds"];
    jsonutil::require_fields(b, {"left", "right", "top", "bottom"}, "dataset bounds");

    Dataset d;
    d.bounds.left = requireNumber(b, "left", "dataset bounds");
    d.bounds.right = requireNumber(b, "right", "dataset bounds");
    d.bounds.top = requireNumber(b, "top", "dataset bounds");
    d.bounds.bottom = requireNumber(b, "bottom", "dataset bounds");
    d.bounds.depth = static_cast<float>(jsonutil::number_or(&b, "depth", 0.0));

    const json& spots = recordArray(j, "spots");
    d.spots.reserve(spots.size());
    for (size_t i = 0; i < spots.size(); ++i) {
        d.spots.push_back(spotFromJson(spots[i], i));
    }

    const json& cells = recordArray(j, "cells");
    d.cells.reserve(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        d.cells.push_back(cellFromJson(cells[i], i));
    }
    return d;
}

Dataset loadDataset(const std::filesystem::path& path)
{
    try {
        Dataset d = datasetFromJson(jsonutil::load_json_file(path));
        Logger()->info("Loaded {}: {} spots, {} cell boundaries", path.string(), d.spots.size(), d.cells.size());
        return d;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed dataset " + path.string() + ": " + e.what());
    }
}

json toJson(const Dataset& dataset)
{
    json j = json::object();
    j["bounds"] = {
        {"left", dataset.bounds.left},
        {"right", dataset.bounds.right},
        {"top", dataset.bounds.top},
        {"bottom", dataset.bounds.bottom},
        {"depth", dataset.bounds.depth}
    };

    json spots = json::array();
    for (const auto& s : dataset.spots) {
        json o = {
            {"gene", s.gene},
            {"x", s.x},
            {"y", s.y},
            {"z", s.z},
            {"plane_id", s.planeId},
            {"spot_id", s.spotId}
        };
        o["parent_cell_id"] = s.parentCellId ? json(*s.parentCellId) : json(nullptr);
        o["parent_cell_X"] = s.parentX ? json(*s.parentX) : json(nullptr);
        o["parent_cell_Y"] = s.parentY ? json(*s.parentY) : json(nullptr);
        o["parent_cell_Z"] = s.parentZ ? json(*s.parentZ) : json(nullptr);
        spots.push_back(std::move(o));
    }
    j["spots"] = {{"count", dataset.spots.size()}, {"data", std::move(spots)}};

    json cells = json::array();
    for (const auto& c : dataset.cells) {
        json boundary = json::array();
        for (const auto& v : c.vertices) {
            boundary.push_back({v.x, v.y});
        }
        json o = {
            {"cellId", c.cellId},
            {"plane", c.planeId},
            {"clippedBoundary", std::move(boundary)}
        };
        if (c.fillColor) {
            o["cellColor"] = toHexColor(*c.fillColor);
        }
        cells.push_back(std::move(o));
    }
    j["cells"] = {{"count", dataset.cells.size()}, {"data", std::move(cells)}};
    return j;
}

VoxelConfig voxelConfigFromJson(const json& j)
{
    VoxelConfig config;
    if (!j.is_object()) {
        throw std::runtime_error("voxel config is not a JSON object");
    }

    if (auto size = j.find("voxelSize"); size != j.end() && !size->is_null()) {
        if (!size->is_array() || size->size() != 3) {
            throw std::runtime_error("voxel config 'voxelSize' must be [x, y, z]");
        }
        cv::Vec3f v;
        for (int i = 0; i < 3; ++i) {
            if (!(*size)[i].is_number()) {
                throw std::runtime_error("voxel config 'voxelSize' must hold numbers");
            }
            v[i] = (*size)[i].get<float>();
        }
        config.voxelSize = v;
    }

    if (auto planes = jsonutil::optional_number(&j, "totalPlanes")) {
        config.totalPlanes = static_cast<int>(*planes);
    }
    return config;
}

VoxelConfig loadVoxelConfig(const std::filesystem::path& path)
{
    return voxelConfigFromJson(jsonutil::load_json_file(path));
}

GeneColorTable geneColorsFromJson(const json& j)
{
    GeneColorTable table;

    auto add = [&table](const std::string& gene, const json& color) {
        auto rgb = colorFromJson(color);
        if (!rgb) {
            Logger()->warn("Ignoring unreadable color {} for gene {}", color.dump(), gene);
            return;
        }
        table.set(gene, *rgb);
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            add(it.key(), it.value());
        }
    } else if (j.is_array()) {
        for (const auto& entry : j) {
            jsonutil::require_fields(entry, {"gene", "color"}, "gene color entry");
            if (!entry["gene"].is_string()) {
                throw std::runtime_error("gene color entry field 'gene' must be a string");
            }
            add(entry["gene"].get<std::string>(), entry["color"]);
        }
    } else {
        throw std::runtime_error("gene colors must be an object or an array");
    }
    return table;
}

GeneColorTable loadGeneColors(const std::filesystem::path& path)
{
    GeneColorTable table = geneColorsFromJson(jsonutil::load_json_file(path));
    Logger()->debug("Loaded {} gene colors from {}", table.size(), path.string());
    return table;
}

DisplayOptions displayOptionsFromJson(const json& j)
{
    DisplayOptions o;
    o.showBackground = jsonutil::bool_or(&j, "showBackground", o.showBackground);
    o.showCellInterior = jsonutil::bool_or(&j, "showCellInterior", o.showCellInterior);
    o.showBoundary = jsonutil::bool_or(&j, "showBoundary", o.showBoundary);
    o.showGhosting = jsonutil::bool_or(&j, "showGhosting", o.showGhosting);
    o.showLinks = jsonutil::bool_or(&j, "showLinks", o.showLinks);
    return o;
}

json toJson(const Voxel& v)
{
    return {
        {"x", v.gridX},
        {"y", v.gridY},
        {"z", v.gridZ},
        {"category", categoryName(v.category)},
        {"color", colorToJson(v.color)},
        {"sourceId", v.sourceId},
        {"planeId", v.planeId}
    };
}

json toJson(const GeneMarker& m)
{
    json j = toJson(m.voxel);
    j["gene"] = m.gene;
    j["spotId"] = m.spotId;
    j["parentCellId"] = m.parentCellId ? json(*m.parentCellId) : json(nullptr);
    return j;
}

json toJson(const LinkLine& l)
{
    return {
        {"source", {l.source[0], l.source[1], l.source[2]}},
        {"target", {l.target[0], l.target[1], l.target[2]}},
        {"color", {l.color[0], l.color[1], l.color[2], l.color[3]}},
        {"gene", l.gene},
        {"spotId", l.spotId},
        {"parentCellId", l.parentCellId}
    };
}

json toJson(const BuildDiagnostics& d)
{
    return {
        {"missingVoxelConfig", d.missingVoxelConfig},
        {"estimatedPlaneCount", d.estimatedPlaneCount},
        {"degenerateBoundaries", d.degenerateBoundaries},
        {"missingParentLinks", d.missingParentLinks},
        {"backgroundParentSpots", d.backgroundParentSpots},
        {"ambiguousCells", d.ambiguousCells},
        {"clippedBoundaryPixels", d.clippedBoundaryPixels}
    };
}

namespace {

template<typename T>
json solidGhostToJson(const SolidGhost<T>& sg)
{
    json solid = json::array();
    for (const auto& item : sg.solid) solid.push_back(toJson(item));
    json ghost = json::array();
    for (const auto& item : sg.ghost) ghost.push_back(toJson(item));
    return {{"solid", std::move(solid)}, {"ghost", std::move(ghost)}};
}

}  // namespace

json toJson(const SlicePartition& p)
{
    return {
        {"sliceY", p.sliceY},
        {"background", solidGhostToJson(p.background)},
        {"cellInterior", solidGhostToJson(p.cellInterior)},
        {"boundary", solidGhostToJson(p.boundary)},
        {"genes", solidGhostToJson(p.genes)},
        {"links", solidGhostToJson(p.links)}
    };
}

json toJson(const RenderLayer& layer)
{
    return {
        {"id", layer.id},
        {"kind", layer.kind == LayerKind::Lines ? "lines" : "voxels"},
        {"category", categoryName(layer.category)},
        {"ghost", layer.ghost},
        {"visible", layer.visible},
        {"pickable", layer.pickable},
        {"opacity", layer.opacity},
        {"count", layer.count}
    };
}

json toJson(const std::vector<RenderLayer>& layers)
{
    json j = json::array();
    for (const auto& layer : layers) j.push_back(toJson(layer));
    return j;
}

json toJson(const std::vector<GeneSummary>& genes)
{
    json j = json::array();
    for (const auto& g : genes) {
        j.push_back({{"gene", g.gene}, {"count", g.spotCount}, {"color", g.hexColor}});
    }
    return j;
}

json sceneSummaryToJson(const VoxelScene& scene)
{
    const NormalizedBounds& b = scene.bounds;
    return {
        {"bounds", {{"left", b.left}, {"right", b.right}, {"top", b.top}, {"bottom", b.bottom}, {"depth", b.depth}}},
        {"extents", {{"maxX", scene.extents.maxX}, {"maxY", scene.extents.maxY}, {"maxZ", scene.extents.maxZ}}},
        {"totalPlanes", scene.totalPlanes},
        {"anisotropicScale", scene.anisotropicScale},
        {"counts", {
            {"background", scene.background.size()},
            {"cellInterior", scene.cellInterior.size()},
            {"boundary", scene.boundary.size()},
            {"genes", scene.genes.size()},
            {"links", scene.links.size()}
        }},
        {"diagnostics", toJson(scene.diagnostics)}
    };
}

void writeJson(const json& j, const std::filesystem::path& path)
{
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }
    out << j.dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path.string());
    }
}

}  // namespace stvox::io
