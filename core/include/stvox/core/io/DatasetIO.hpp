#pragma once

#include "stvox/core/types/Dataset.hpp"
#include "stvox/core/types/Voxel.hpp"
#include "stvox/core/types/VoxelConfig.hpp"
#include "stvox/core/util/Color.hpp"
#include "stvox/core/util/GeneSpots.hpp"
#include "stvox/core/util/SlicePartition.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <vector>

namespace stvox::io {

// Selection export: {"bounds": {...}, "spots": {"data": [...]}, "cells": {"data": [...]}}.
// The spots and cells entries may also be bare arrays.
// Throws std::runtime_error on missing bounds or malformed records.
Dataset datasetFromJson(const nlohmann::json& j);
Dataset loadDataset(const std::filesystem::path& path);
nlohmann::json toJson(const Dataset& dataset);

VoxelConfig voxelConfigFromJson(const nlohmann::json& j);
VoxelConfig loadVoxelConfig(const std::filesystem::path& path);

// {"GENE": "#rrggbb" | [r, g, b]} or [{"gene": ..., "color": ...}, ...]
GeneColorTable geneColorsFromJson(const nlohmann::json& j);
GeneColorTable loadGeneColors(const std::filesystem::path& path);

DisplayOptions displayOptionsFromJson(const nlohmann::json& j);

nlohmann::json toJson(const Voxel& v);
nlohmann::json toJson(const GeneMarker& m);
nlohmann::json toJson(const LinkLine& l);
nlohmann::json toJson(const BuildDiagnostics& d);
nlohmann::json toJson(const SlicePartition& p);
nlohmann::json toJson(const RenderLayer& layer);
nlohmann::json toJson(const std::vector<RenderLayer>& layers);
nlohmann::json toJson(const std::vector<GeneSummary>& genes);

// Bounds, extents, plane mapping, per-category counts and diagnostics; no voxels
nlohmann::json sceneSummaryToJson(const VoxelScene& scene);

// Writes with 2-space indentation; throws std::runtime_error when the file cannot be written
void writeJson(const nlohmann::json& j, const std::filesystem::path& path);

}  // namespace stvox::io
