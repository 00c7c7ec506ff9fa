#pragma once

#include "core/style.h"
#include "core/token_types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// RTF format module (export).
//
// Renders a classified token stream into a self-contained RTF document:
//   {\rtf1\ansi\uc0\deff0{\fonttbl{\f0\fmodern\fprq1\fcharset0[ font];}}{\colortbl;...}\f0 [\fsN ]<body>}
//
// - Colors referenced by any style are collected into one deduplicated color table (1-based).
// - Text is escaped to 7-bit ASCII: {\uN} for BMP code points, surrogate pairs above U+FFFF.
// - Each token becomes one run; only the style control words that are set are emitted.
// - Optional line numbers need the total line count up front, so numbering materializes the
//   token stream in a pre-pass. Without numbering the source is consumed strictly forward.
namespace formats
{
namespace rtf
{
// Lowercase extensions (no leading dot).
const std::vector<std::string_view>& ExportExtensions(); // {"rtf"}

enum class ErrorCode
{
    None = 0,
    // A style color is not exactly 6 hex digits.
    InvalidColorFormat,
    // A rendered run references a color missing from the color table.
    UnknownColorReference,
    Io,
};

const char* ErrorCodeName(ErrorCode code);

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------
struct ExportOptions
{
    // Font family for the single \fmodern font table entry. Empty keeps the generic fixed-pitch font.
    std::string font_family;

    // Default font size in half-points. 0 leaves the viewer's default.
    int font_size = 0;

    bool line_numbers = false;
    // Half-points.
    int line_number_font_size = 18;
    int line_number_start = 1;
    // Only every nth line (counted from line_number_start) gets a numeral; others get blank padding.
    int line_number_step = 1;
    // 6 hex digits. Empty: the style's line_number_color, else black.
    std::string line_number_color;
};

// Applies one textual option. Keys accept both spellings, e.g. "line_numbers" and "linenos".
// Integers are parsed strictly and taken as absolute values.
bool ApplyOption(ExportOptions& opts, std::string_view key, std::string_view value, std::string& err);

// Applies "key=value,key=value".
bool ApplyOptionList(ExportOptions& opts, std::string_view list, std::string& err);

// Applies every member of a JSON object (strings, integers and booleans).
bool ApplyOptionsFromJson(ExportOptions& opts, const nlohmann::json& j, std::string& err);

// ---------------------------------------------------------------------------
// Color table
// ---------------------------------------------------------------------------
struct ColorTable
{
    struct Entry
    {
        int index = 0;   // 1-based
        std::string hex; // 6 hex digits, as written by the style
        std::uint8_t r = 0, g = 0, b = 0;
    };

    std::vector<Entry> entries; // in index order
    std::unordered_map<std::string, int> index_by_hex;

    // 0 when absent (0 is the implicit "auto" slot and never a valid reference).
    int IndexOf(const std::string& hex) const
    {
        auto it = index_by_hex.find(hex);
        return (it == index_by_hex.end()) ? 0 : it->second;
    }
};

// Scans the style's entries in order (color, bgcolor, border per category), assigning
// indices on first sighting. With line numbers enabled the line-number color takes index 1.
bool BuildColorTable(const rubric::style::Style& style,
                     const ExportOptions& opts,
                     ColorTable& out,
                     std::string& err,
                     ErrorCode* out_code = nullptr);

void WriteHeader(const ExportOptions& opts, const ColorTable& colors, std::string& out);

// ---------------------------------------------------------------------------
// Escaping
// ---------------------------------------------------------------------------
// Backslash and braces only.
std::string EscapeStructural(std::string_view text);

// Full escaping of UTF-8 text (structural, \uN groups, surrogate pairs, \par per newline).
std::string EscapeText(std::string_view text);
void AppendEscapedText(std::string_view text, std::string& out);

// ---------------------------------------------------------------------------
// Line numbering
// ---------------------------------------------------------------------------
struct LinePrepassResult
{
    std::vector<rubric::tokens::Token> tokens;
    int line_count = 0;
    int width = 1;
};

int DigitCount(long long v);

// Materializes `src`, splitting multi-line doc-string tokens at each newline, and counts lines.
void LinePrepass(rubric::tokens::TokenSource& src,
                 const rubric::tokens::TokenTypeTree& tree,
                 const ExportOptions& opts,
                 LinePrepassResult& out);

// True when `lineno` gets a printed numeral.
bool IsNumberedLine(long long lineno, long long start, long long step);

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------
struct RenderContext
{
    const rubric::style::Style* style = nullptr;
    const ColorTable* colors = nullptr;

    bool line_numbers = false;
    int line_number_font_size = 18;
    int line_number_start = 1;
    int line_number_step = 1;
    int line_number_width = 1;
};

struct LineState
{
    // Wider than the int options so that counting up from a large start cannot overflow.
    long long lineno = 1;
    // The next run starts a new line and owes a number slot first.
    bool pending_number = true;
    // Number slots written so far.
    int slots_written = 0;
};

LineState InitialLineState(const ExportOptions& opts);

// Appends one token's markup to `out` and advances `state`.
bool RenderToken(const RenderContext& ctx,
                 LineState& state,
                 const rubric::tokens::Token& token,
                 std::string& out,
                 std::string& err,
                 ErrorCode* out_code = nullptr);

struct ExportStats
{
    std::size_t tokens = 0;
    std::size_t colors = 0;
    int lines = 0;        // pre-pass line count (0 without numbering)
    int number_slots = 0; // line-number groups written
    ErrorCode error = ErrorCode::None;
};

// On failure `out` is left empty.
bool ExportTokensToString(rubric::tokens::TokenSource& src,
                          const rubric::style::Style& style,
                          std::string& out,
                          std::string& err,
                          const ExportOptions& options = {},
                          ExportStats* stats = nullptr);

bool ExportTokensToBytes(rubric::tokens::TokenSource& src,
                         const rubric::style::Style& style,
                         std::vector<std::uint8_t>& out_bytes,
                         std::string& err,
                         const ExportOptions& options = {},
                         ExportStats* stats = nullptr);

bool ExportTokensToFile(const std::string& path,
                        rubric::tokens::TokenSource& src,
                        const rubric::style::Style& style,
                        std::string& err,
                        const ExportOptions& options = {},
                        ExportStats* stats = nullptr);

// ---------------------------------------------------------------------------
// Presets (profiles)
// ---------------------------------------------------------------------------
enum class PresetId : int
{
    Plain = 0,
    Numbered,
    NumberedEvery5,
};

struct Preset
{
    PresetId id = PresetId::Plain;
    const char* name = nullptr;
    const char* description = nullptr;
    ExportOptions export_ = {};
};

const std::vector<Preset>& Presets();
const Preset* FindPreset(PresetId id);
// Case-insensitive.
const Preset* FindPresetByName(std::string_view name);
} // namespace rtf
} // namespace formats
