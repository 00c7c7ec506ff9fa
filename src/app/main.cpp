#include "core/style.h"
#include "core/token_types.h"
#include "io/formats/rtf.h"
#include "io/formats/style_json.h"
#include "io/formats/tokendump.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{
namespace fs = std::filesystem;

static std::string ToLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] [<tokens.jsonl> | -]\n"
              << "\n"
              << "Renders a classified token stream into an RTF document. Input is JSON lines of\n"
              << "[\"Category\", \"text\"] pairs (streamed); a .json file may instead hold one array of pairs.\n"
              << "\n"
              << "Options:\n"
              << "  --theme <file|name>   Style theme JSON, or a name under assets/styles (default: default)\n"
              << "  --config <file>       JSON config; its \"rtf\" object holds export options\n"
              << "  --preset <name>       Plain | Numbered | NumberedEvery5\n"
              << "  -O <k=v[,k=v...]>     Export options (font_family, font_size, linenos, lineno_fontsize,\n"
              << "                        linenostart, linenostep, lineno_color)\n"
              << "  --linenos             Same as -O linenos=1\n"
              << "  --font <family>       Same as -O font_family=<family>\n"
              << "  --font-size <n>       Same as -O font_size=<n> (half-points)\n"
              << "  -o <file>             Output file (default: stdout)\n"
              << "  --list-themes         List built-in themes and exit\n"
              << "  --verbose             Print a summary to stderr\n";
}

static bool LoadConfig(const std::string& path, formats::rtf::ExportOptions& opts, std::string& err)
{
    std::ifstream f(path);
    if (!f)
    {
        err = std::string("Failed to open ") + path;
        return false;
    }
    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
    if (!j.is_object())
    {
        err = "Config root must be an object.";
        return false;
    }
    auto it = j.find("rtf");
    if (it == j.end())
        return true;
    return formats::rtf::ApplyOptionsFromJson(opts, *it, err);
}

static int ListThemes()
{
    std::vector<formats::style_json::ThemeInfo> themes;
    std::string err;
    if (!formats::style_json::ListBuiltinThemes(themes, err))
    {
        std::fprintf(stderr, "[theme] %s\n", err.c_str());
        return 3;
    }
    for (const auto& t : themes)
    {
        std::cout << t.name;
        if (!t.author.empty())
            std::cout << " (" << t.author << ")";
        std::cout << "  " << t.path << "\n";
    }
    return 0;
}
} // namespace

int main(int argc, char** argv)
{
    std::string theme = "default";
    bool theme_given = false;
    std::string config_path;
    std::string preset_name;
    std::string output_path;
    std::string input_path = "-";
    std::vector<std::string> option_lists;
    bool verbose = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--theme")
        {
            theme = need("--theme");
            theme_given = true;
        }
        else if (a == "--config")
            config_path = need("--config");
        else if (a == "--preset")
            preset_name = need("--preset");
        else if (a == "-O")
            option_lists.push_back(need("-O"));
        else if (a == "--linenos")
            option_lists.push_back("linenos=1");
        else if (a == "--font")
            option_lists.push_back("font_family=" + need("--font"));
        else if (a == "--font-size")
            option_lists.push_back("font_size=" + need("--font-size"));
        else if (a == "-o")
            output_path = need("-o");
        else if (a == "--list-themes")
            return ListThemes();
        else if (a == "--verbose")
            verbose = true;
        else if (a == "-" || a.empty() || a[0] != '-')
            input_path = std::string(a);
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    // Options layer in order: preset, config file, command line.
    formats::rtf::ExportOptions opts;
    if (!preset_name.empty())
    {
        const formats::rtf::Preset* p = formats::rtf::FindPresetByName(preset_name);
        if (!p)
        {
            std::fprintf(stderr, "[config] unknown preset: %s\n", preset_name.c_str());
            return 2;
        }
        opts = p->export_;
    }

    std::string err;
    if (!config_path.empty() && !LoadConfig(config_path, opts, err))
    {
        std::fprintf(stderr, "[config] %s: %s\n", config_path.c_str(), err.c_str());
        return 3;
    }
    for (const std::string& list : option_lists)
    {
        if (!formats::rtf::ApplyOptionList(opts, list, err))
        {
            std::fprintf(stderr, "[config] %s\n", err.c_str());
            return 2;
        }
    }

    rubric::tokens::TokenTypeTree tree;
    rubric::style::Style style(tree);
    if (!formats::style_json::LoadThemeOrMinimal(theme, theme_given, tree, style, err))
    {
        std::fprintf(stderr, "[theme] %s\n", err.c_str());
        return 3;
    }
    if (!err.empty())
        std::fprintf(stderr, "[theme] %s; using %s\n", err.c_str(), style.name.c_str());

    // .json inputs may be one array document and are read whole; everything else streams.
    std::vector<rubric::tokens::Token> whole;
    const bool read_whole = input_path != "-" && ToLowerAscii(fs::path(input_path).extension().string()) == ".json";
    if (read_whole && !formats::tokendump::ImportFileToTokens(input_path, tree, whole, err))
    {
        std::fprintf(stderr, "[tokens] %s: %s\n", input_path.c_str(), err.c_str());
        return 3;
    }

    std::ifstream file_in;
    std::istream* in = &std::cin;
    if (!read_whole && input_path != "-")
    {
        file_in.open(input_path, std::ios::binary);
        if (!file_in)
        {
            std::fprintf(stderr, "[tokens] failed to open %s\n", input_path.c_str());
            return 3;
        }
        in = &file_in;
    }

    formats::rtf::ExportStats stats;
    std::string doc;
    bool ok = false;
    if (read_whole)
    {
        rubric::tokens::VectorTokenSource src(whole);
        ok = formats::rtf::ExportTokensToString(src, style, doc, err, opts, &stats);
    }
    else
    {
        formats::tokendump::JsonLinesTokenSource src(*in, tree);
        ok = formats::rtf::ExportTokensToString(src, style, doc, err, opts, &stats);
        if (ok && src.Failed())
        {
            std::fprintf(stderr, "[tokens] %s\n", src.Error().c_str());
            return 3;
        }
    }

    if (!ok)
    {
        std::fprintf(stderr, "[rtf] %s: %s\n", formats::rtf::ErrorCodeName(stats.error), err.c_str());
        return 1;
    }

    if (output_path.empty())
    {
        std::cout.write(doc.data(), (std::streamsize)doc.size());
        std::cout.flush();
    }
    else
    {
        std::ofstream out(output_path, std::ios::binary);
        if (!out || !out.write(doc.data(), (std::streamsize)doc.size()))
        {
            std::fprintf(stderr, "[rtf] failed to write %s\n", output_path.c_str());
            return 3;
        }
    }

    if (verbose)
    {
        std::fprintf(stderr, "[rtf] theme '%s': %zu tokens, %zu colors", style.name.c_str(), stats.tokens, stats.colors);
        if (opts.line_numbers)
            std::fprintf(stderr, ", %d lines", stats.lines);
        std::fprintf(stderr, "\n");
    }
    return 0;
}
