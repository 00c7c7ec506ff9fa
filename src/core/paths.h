#pragma once

#include <string>

// Returns the base assets directory used by rubric.
//
// Defaults to "./assets"; the RUBRIC_ASSETS_DIR environment variable overrides it.
std::string GetRubricAssetsDir();

// Joins the assets dir and a relative path within it.
// Example: RubricAssetPath("styles/default.json") -> "<assets_dir>/styles/default.json"
std::string RubricAssetPath(const std::string& relative);
