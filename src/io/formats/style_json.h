#pragma once

#include "core/style.h"
#include "core/token_types.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

// Style theme format module (import).
//
// A theme is a JSON object:
//   {
//     "name": "Default", "author": "...",
//     "colors": { "<alias>": "#RRGGBB", ... },
//     "line_number_color": "#RRGGBB",
//     "tokens": { "<Category.Name>": { "fg", "bg", "border", "attrs", "inherit" }, ... }
//   }
//
// Colors accept "#RRGGBB", "RRGGBB", "#RGB" (expanded) and "name:<alias>".
// attrs accept bold/italic/underline and nobold/noitalic/nounderline.
namespace formats::style_json
{
using json = nlohmann::json;

// Lowercase extension (no leading dot).
const std::vector<std::string_view>& ImportExtensions(); // {"json"}

struct ThemeInfo
{
    std::string path;   // theme file path inside the assets dir
    std::string name;   // theme.name
    std::string author; // optional
};

// Scans the assets directory for built-in themes:
//   assets/styles/*.json
bool ListBuiltinThemes(std::vector<ThemeInfo>& out, std::string& err);

// Accepts a path to an existing file, or a built-in theme name ("default" -> assets/styles/default.json).
std::string ResolveThemePath(const std::string& name_or_path);

// Normalizes "#RRGGBB" / "RRGGBB" / "#RGB" to 6 hex digits (case preserved).
bool NormalizeHexColor(std::string_view s, std::string& out_hex);

// Categories named by the theme are interned into `tree`, which must be the tree `out` was built on.
bool LoadStyleFromJson(const json& j, rubric::tokens::TokenTypeTree& tree, rubric::style::Style& out, std::string& err);

bool ImportTextToStyle(std::string_view text,
                       rubric::tokens::TokenTypeTree& tree,
                       rubric::style::Style& out,
                       std::string& err);

bool ImportFileToStyle(const std::string& path,
                       rubric::tokens::TokenTypeTree& tree,
                       rubric::style::Style& out,
                       std::string& err);

// Fallback when no theme can be loaded: only an empty root style.
rubric::style::Style MinimalTheme(const rubric::tokens::TokenTypeTree& tree);

// Loads a theme by name or path. When `required` is false a failed load yields
// MinimalTheme and still returns true; `err` then carries the load error as a warning.
bool LoadThemeOrMinimal(const std::string& name_or_path,
                        bool required,
                        rubric::tokens::TokenTypeTree& tree,
                        rubric::style::Style& out,
                        std::string& err);
} // namespace formats::style_json
