#include "io/formats/style_json.h"

#include "core/paths.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace formats::style_json
{
const std::vector<std::string_view>& ImportExtensions()
{
    static const std::vector<std::string_view> exts = {"json"};
    return exts;
}

namespace
{
namespace fs = std::filesystem;
using rubric::style::Style;
using rubric::style::StyleSpec;

static std::string ToLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

struct ThemeHeader
{
    std::string name;
    std::string author;
    std::unordered_map<std::string, std::string> colors; // alias -> color string
};

static bool ResolveColorString(const ThemeHeader& t, const std::string& s, std::string& out, std::string& err, int depth = 0)
{
    if (depth > 16)
    {
        err = "Theme color alias recursion limit exceeded.";
        return false;
    }
    if (s.rfind("name:", 0) == 0)
    {
        const std::string key = s.substr(5);
        auto it = t.colors.find(key);
        if (it == t.colors.end())
        {
            err = std::string("Theme color alias not found: ") + key;
            return false;
        }
        return ResolveColorString(t, it->second, out, err, depth + 1);
    }
    if (!NormalizeHexColor(s, out))
    {
        err = std::string("Invalid color string: ") + s;
        return false;
    }
    return true;
}

static void ApplyAttrName(const std::string& s, StyleSpec& spec)
{
    const std::string k = ToLowerAscii(s);
    if (k == "bold") spec.bold = true;
    else if (k == "nobold") spec.bold = false;
    else if (k == "italic") spec.italic = true;
    else if (k == "noitalic") spec.italic = false;
    else if (k == "underline") spec.underline = true;
    else if (k == "nounderline") spec.underline = false;
    // Other attributes have no RTF run equivalent here (ignored).
}

static bool ParseStyleSpec(const ThemeHeader& theme, const json& j, StyleSpec& out, std::string& err)
{
    err.clear();
    out = StyleSpec{};
    if (!j.is_object())
        return true;

    auto parse_color = [&](const char* key, std::optional<std::string>& dst) -> bool {
        auto it = j.find(key);
        if (it == j.end())
            return true;
        if (!it->is_string())
            return true;
        const std::string s = it->get<std::string>();
        // Explicitly empty clears an inherited color.
        if (s.empty())
        {
            dst = std::string();
            return true;
        }
        std::string hex;
        std::string e;
        if (!ResolveColorString(theme, s, hex, e))
        {
            err = e;
            return false;
        }
        dst = hex;
        return true;
    };

    if (!parse_color("fg", out.fg)) return false;
    if (!parse_color("bg", out.bg)) return false;
    if (!parse_color("border", out.border)) return false;

    if (auto it = j.find("attrs"); it != j.end() && it->is_array())
    {
        for (const auto& a : *it)
        {
            if (!a.is_string())
                continue;
            ApplyAttrName(a.get<std::string>(), out);
        }
    }

    if (auto it = j.find("inherit"); it != j.end() && it->is_boolean())
        out.inherit = it->get<bool>();

    return true;
}

static bool ReadThemeHeader(const json& j, ThemeHeader& out)
{
    out = ThemeHeader{};
    if (auto it = j.find("name"); it != j.end() && it->is_string())
        out.name = it->get<std::string>();
    if (out.name.empty())
        out.name = "(unnamed)";
    if (auto it = j.find("author"); it != j.end() && it->is_string())
        out.author = it->get<std::string>();

    if (auto it = j.find("colors"); it != j.end() && it->is_object())
    {
        for (auto it2 = it->begin(); it2 != it->end(); ++it2)
        {
            if (!it2.value().is_string())
                continue;
            out.colors[it2.key()] = it2.value().get<std::string>();
        }
    }
    return true;
}

static bool ReadJsonFile(const std::string& path, json& out, std::string& err)
{
    std::ifstream f(path);
    if (!f)
    {
        err = std::string("Failed to open theme: ") + path;
        return false;
    }
    try
    {
        f >> out;
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
    return true;
}
} // namespace

bool NormalizeHexColor(std::string_view s, std::string& out_hex)
{
    if (!s.empty() && s[0] == '#')
        s.remove_prefix(1);
    if (s.size() != 6 && s.size() != 3)
        return false;
    for (char c : s)
    {
        if (!std::isxdigit((unsigned char)c))
            return false;
    }

    out_hex.clear();
    if (s.size() == 3)
    {
        for (char c : s)
        {
            out_hex.push_back(c);
            out_hex.push_back(c);
        }
        return true;
    }
    out_hex.assign(s.begin(), s.end());
    return true;
}

bool LoadStyleFromJson(const json& j, rubric::tokens::TokenTypeTree& tree, Style& out, std::string& err)
{
    err.clear();
    out = Style(tree);

    if (!j.is_object())
    {
        err = "Theme JSON must be an object.";
        return false;
    }

    ThemeHeader header;
    ReadThemeHeader(j, header);
    out.name = header.name;
    out.author = header.author;

    if (auto it = j.find("line_number_color"); it != j.end() && it->is_string())
    {
        std::string hex;
        std::string e;
        if (!ResolveColorString(header, it->get<std::string>(), hex, e))
        {
            err = std::string("Theme line_number_color: ") + e;
            return false;
        }
        out.line_number_color = hex;
    }

    // Tokens map (optional; a theme without it styles nothing).
    if (auto it = j.find("tokens"); it != j.end() && it->is_object())
    {
        for (auto it2 = it->begin(); it2 != it->end(); ++it2)
        {
            const rubric::tokens::TokenType t = tree.Intern(it2.key());
            if (t == rubric::tokens::kInvalid)
            {
                err = std::string("Theme token '") + it2.key() + "': invalid category name";
                return false;
            }
            StyleSpec s;
            std::string e;
            if (!ParseStyleSpec(header, it2.value(), s, e))
            {
                err = std::string("Theme token '") + it2.key() + "': " + e;
                return false;
            }
            out.Define(t, s);
        }
    }

    return true;
}

bool ImportTextToStyle(std::string_view text, rubric::tokens::TokenTypeTree& tree, Style& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(text.begin(), text.end());
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
    return LoadStyleFromJson(j, tree, out, err);
}

bool ImportFileToStyle(const std::string& path, rubric::tokens::TokenTypeTree& tree, Style& out, std::string& err)
{
    err.clear();
    json j;
    if (!ReadJsonFile(path, j, err))
        return false;
    return LoadStyleFromJson(j, tree, out, err);
}

Style MinimalTheme(const rubric::tokens::TokenTypeTree& tree)
{
    Style s(tree);
    s.name = "Minimal";
    return s;
}

bool LoadThemeOrMinimal(const std::string& name_or_path,
                        bool required,
                        rubric::tokens::TokenTypeTree& tree,
                        Style& out,
                        std::string& err)
{
    err.clear();
    Style loaded(tree);
    if (ImportFileToStyle(ResolveThemePath(name_or_path), tree, loaded, err))
    {
        out = loaded;
        return true;
    }
    if (required)
        return false;
    out = MinimalTheme(tree);
    return true;
}

std::string ResolveThemePath(const std::string& name_or_path)
{
    std::error_code ec;
    if (fs::is_regular_file(fs::path(name_or_path), ec))
        return name_or_path;
    std::string file = name_or_path;
    if (ToLowerAscii(fs::path(file).extension().string()) != ".json")
        file += ".json";
    return RubricAssetPath("styles/" + file);
}

bool ListBuiltinThemes(std::vector<ThemeInfo>& out, std::string& err)
{
    err.clear();
    out.clear();

    const fs::path dir = fs::path(RubricAssetPath("styles"));
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
    {
        err = std::string("Theme directory not found: ") + dir.string();
        return false;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec))
    {
        if (!entry.is_regular_file())
            continue;
        const fs::path& p = entry.path();
        if (ToLowerAscii(p.extension().string()) != ".json")
            continue;

        json j;
        std::string terr;
        if (!ReadJsonFile(p.string(), j, terr) || !j.is_object())
            continue;
        ThemeHeader header;
        ReadThemeHeader(j, header);

        ThemeInfo info;
        info.path = p.string();
        info.name = header.name;
        info.author = header.author;
        out.push_back(std::move(info));
    }
    if (ec)
    {
        err = ec.message();
        return false;
    }

    std::sort(out.begin(), out.end(), [](const ThemeInfo& a, const ThemeInfo& b) {
        return a.name < b.name;
    });
    return true;
}
} // namespace formats::style_json
