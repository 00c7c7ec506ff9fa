#include "io/formats/rtf.h"

#include "core/utf8.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <string>
#include <utility>

namespace formats
{
namespace rtf
{
const std::vector<std::string_view>& ExportExtensions()
{
    static const std::vector<std::string_view> exts = {"rtf"};
    return exts;
}

const char* ErrorCodeName(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidColorFormat: return "InvalidColorFormat";
        case ErrorCode::UnknownColorReference: return "UnknownColorReference";
        case ErrorCode::Io: return "Io";
    }
    return "Unknown";
}

namespace
{
using rubric::style::Style;
using rubric::style::StyleRecord;
using rubric::tokens::Token;
using rubric::tokens::TokenSource;

static constexpr const char* kDefaultLineNumberColor = "000000";

static void SetCode(ErrorCode* out_code, ErrorCode code)
{
    if (out_code)
        *out_code = code;
}

static std::string ToLowerAscii(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = (char)std::tolower((unsigned char)c);
    return out;
}

static std::string_view TrimAscii(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

static int Nybble(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

// Strict: exactly 6 hex digits, no '#'.
static bool ParseHex6(const std::string& hex, std::uint8_t& r, std::uint8_t& g, std::uint8_t& b)
{
    if (hex.size() != 6)
        return false;
    int v[6];
    for (int i = 0; i < 6; ++i)
    {
        v[i] = Nybble(hex[(size_t)i]);
        if (v[i] < 0)
            return false;
    }
    r = (std::uint8_t)((v[0] << 4) | v[1]);
    g = (std::uint8_t)((v[2] << 4) | v[3]);
    b = (std::uint8_t)((v[4] << 4) | v[5]);
    return true;
}

static bool ParseIntAbs(std::string_view s, int& out)
{
    s = TrimAscii(s);
    // The sign is dropped: integer options are absolute values.
    if (!s.empty() && (s[0] == '+' || s[0] == '-'))
        s.remove_prefix(1);
    if (s.empty() || s[0] < '0' || s[0] > '9')
        return false;
    int v = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return false;
    out = v;
    return true;
}

static bool ParseBool(std::string_view s, bool& out)
{
    const std::string k = ToLowerAscii(TrimAscii(s));
    if (k == "1" || k == "true" || k == "yes" || k == "on")
    {
        out = true;
        return true;
    }
    if (k == "0" || k == "false" || k == "no" || k == "off" || k.empty())
    {
        out = false;
        return true;
    }
    return false;
}

static void AppendInt(std::string& out, long long v)
{
    char buf[24];
    const int n = std::snprintf(buf, sizeof(buf), "%lld", v);
    if (n > 0)
        out.append(buf, (size_t)n);
}

static void AppendUnicodeGroup(std::string& out, unsigned v)
{
    char buf[24];
    const int n = std::snprintf(buf, sizeof(buf), "{\\u%u}", v);
    if (n > 0)
        out.append(buf, (size_t)n);
}

static bool EndsWithNewline(const std::string& s)
{
    return !s.empty() && s.back() == '\n';
}

static const std::string& LineNumberColorFor(const Style& style, const ExportOptions& opts)
{
    static const std::string kDefault = kDefaultLineNumberColor;
    if (!opts.line_number_color.empty())
        return opts.line_number_color;
    if (!style.line_number_color.empty())
        return style.line_number_color;
    return kDefault;
}
} // namespace

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------
bool ApplyOption(ExportOptions& opts, std::string_view key_in, std::string_view value, std::string& err)
{
    err.clear();
    const std::string key = ToLowerAscii(TrimAscii(key_in));

    auto need_int = [&](int& dst, bool allow_zero) -> bool {
        int v = 0;
        if (!ParseIntAbs(value, v))
        {
            err = "Option '" + key + "' expects an integer, got '" + std::string(value) + "'.";
            return false;
        }
        if (v == 0 && !allow_zero)
        {
            err = "Option '" + key + "' must be a positive integer.";
            return false;
        }
        dst = v;
        return true;
    };

    if (key == "font_family" || key == "fontface")
    {
        opts.font_family = std::string(TrimAscii(value));
        return true;
    }
    if (key == "font_size" || key == "fontsize")
        return need_int(opts.font_size, true);
    if (key == "line_numbers" || key == "linenos")
    {
        if (!ParseBool(value, opts.line_numbers))
        {
            err = "Option '" + key + "' expects a boolean, got '" + std::string(value) + "'.";
            return false;
        }
        return true;
    }
    if (key == "line_number_font_size" || key == "lineno_fontsize")
        return need_int(opts.line_number_font_size, false);
    if (key == "line_number_start" || key == "linenostart")
        return need_int(opts.line_number_start, false);
    if (key == "line_number_step" || key == "linenostep")
        return need_int(opts.line_number_step, false);
    if (key == "line_number_color" || key == "lineno_color")
    {
        std::string_view v = TrimAscii(value);
        if (!v.empty() && v[0] == '#')
            v.remove_prefix(1);
        std::uint8_t r = 0, g = 0, b = 0;
        const std::string hex(v);
        if (!hex.empty() && !ParseHex6(hex, r, g, b))
        {
            err = "Option '" + key + "' expects a 6 hex digit color, got '" + std::string(value) + "'.";
            return false;
        }
        opts.line_number_color = hex;
        return true;
    }

    err = "Unknown option: " + key;
    return false;
}

bool ApplyOptionList(ExportOptions& opts, std::string_view list, std::string& err)
{
    err.clear();
    std::size_t pos = 0;
    while (pos <= list.size())
    {
        std::size_t comma = list.find(',', pos);
        if (comma == std::string_view::npos)
            comma = list.size();
        const std::string_view item = TrimAscii(list.substr(pos, comma - pos));
        pos = comma + 1;
        if (item.empty())
            continue;

        const std::size_t eq = item.find('=');
        // A bare key is shorthand for key=1 (e.g. "linenos").
        const std::string_view key = (eq == std::string_view::npos) ? item : item.substr(0, eq);
        const std::string_view value = (eq == std::string_view::npos) ? std::string_view("1") : item.substr(eq + 1);
        if (!ApplyOption(opts, key, value, err))
            return false;
    }
    return true;
}

bool ApplyOptionsFromJson(ExportOptions& opts, const nlohmann::json& j, std::string& err)
{
    err.clear();
    if (!j.is_object())
    {
        err = "Options JSON must be an object.";
        return false;
    }
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const auto& v = it.value();
        std::string text;
        if (v.is_string())
            text = v.get<std::string>();
        else if (v.is_boolean())
            text = v.get<bool>() ? "1" : "0";
        else if (v.is_number_integer())
            text = std::to_string(v.get<long long>());
        else
        {
            err = "Option '" + it.key() + "' has an unsupported JSON type.";
            return false;
        }
        if (!ApplyOption(opts, it.key(), text, err))
            return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Color table
// ---------------------------------------------------------------------------
bool BuildColorTable(const Style& style, const ExportOptions& opts, ColorTable& out, std::string& err, ErrorCode* out_code)
{
    err.clear();
    out = ColorTable{};
    SetCode(out_code, ErrorCode::None);

    int next_index = 1;
    auto add = [&](const std::string& hex, const char* what) -> bool {
        if (hex.empty() || out.index_by_hex.count(hex) != 0)
            return true;
        ColorTable::Entry e;
        if (!ParseHex6(hex, e.r, e.g, e.b))
        {
            err = std::string("Invalid color format for ") + what + ": '" + hex + "' (expected 6 hex digits).";
            SetCode(out_code, ErrorCode::InvalidColorFormat);
            return false;
        }
        e.index = next_index++;
        e.hex = hex;
        out.index_by_hex.emplace(hex, e.index);
        out.entries.push_back(std::move(e));
        return true;
    };

    // Line-number groups always reference \cf1.
    if (opts.line_numbers && !add(LineNumberColorFor(style, opts), "line numbers"))
        return false;

    for (const Style::Entry& entry : style.Entries())
    {
        const std::string where = style.Tree().FullName(entry.type);
        if (!add(entry.record.color, where.c_str())) return false;
        if (!add(entry.record.bgcolor, where.c_str())) return false;
        if (!add(entry.record.border, where.c_str())) return false;
    }
    return true;
}

void WriteHeader(const ExportOptions& opts, const ColorTable& colors, std::string& out)
{
    out += "{\\rtf1\\ansi\\uc0\\deff0";
    out += "{\\fonttbl{\\f0\\fmodern\\fprq1\\fcharset0";
    if (!opts.font_family.empty())
    {
        out += ' ';
        out += EscapeStructural(opts.font_family);
    }
    out += ";}}";

    out += "{\\colortbl;";
    for (const ColorTable::Entry& e : colors.entries)
    {
        out += "\\red";
        AppendInt(out, e.r);
        out += "\\green";
        AppendInt(out, e.g);
        out += "\\blue";
        AppendInt(out, e.b);
        out += ';';
    }
    out += "}\\f0 ";

    if (opts.font_size > 0)
    {
        out += "\\fs";
        AppendInt(out, opts.font_size);
        out += ' ';
    }
}

// ---------------------------------------------------------------------------
// Escaping
// ---------------------------------------------------------------------------
std::string EscapeStructural(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == '\\' || c == '{' || c == '}')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

void AppendEscapedText(std::string_view text, std::string& out)
{
    if (text.empty())
        return;

    std::size_t i = 0;
    while (i < text.size())
    {
        char32_t cp = U'\0';
        if (!rubric::utf8::DecodeOne(text.data(), text.size(), i, cp))
            cp = U'\uFFFD';

        if (cp < 0x80)
        {
            if (cp == U'\\' || cp == U'{' || cp == U'}')
            {
                out.push_back('\\');
                out.push_back((char)cp);
            }
            else if (cp == U'\n')
            {
                out += "\\par\n";
            }
            else
            {
                out.push_back((char)cp);
            }
        }
        else if (cp < 0x10000)
        {
            AppendUnicodeGroup(out, (unsigned)cp);
        }
        else
        {
            // \uN is limited to 16 bits: write the UTF-16 surrogate pair.
            const unsigned v = (unsigned)cp - 0x10000u;
            AppendUnicodeGroup(out, 0xD800u + (v >> 10));
            AppendUnicodeGroup(out, 0xDC00u + (v & 0x3FFu));
        }
    }
}

std::string EscapeText(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    AppendEscapedText(text, out);
    return out;
}

// ---------------------------------------------------------------------------
// Line numbering
// ---------------------------------------------------------------------------
int DigitCount(long long v)
{
    if (v < 0)
        v = -v;
    int n = 1;
    while (v >= 10)
    {
        v /= 10;
        ++n;
    }
    return n;
}

bool IsNumberedLine(long long lineno, long long start, long long step)
{
    if (step <= 1)
        return true;
    return (lineno - start) % step == 0;
}

void LinePrepass(TokenSource& src, const rubric::tokens::TokenTypeTree& tree, const ExportOptions& opts, LinePrepassResult& out)
{
    out = LinePrepassResult{};

    const rubric::tokens::TokenType doc = tree.StringDoc();
    Token tok;
    while (src.Next(tok))
    {
        if (tok.type == doc && tok.text.find('\n') != std::string::npos)
        {
            // One fragment per line; every fragment keeps its own newline.
            std::size_t pos = 0;
            while (pos < tok.text.size())
            {
                std::size_t nl = tok.text.find('\n', pos);
                const std::size_t end = (nl == std::string::npos) ? tok.text.size() : nl + 1;
                out.tokens.push_back(Token{tok.type, tok.text.substr(pos, end - pos)});
                pos = end;
            }
            continue;
        }
        out.tokens.push_back(std::move(tok));
        tok = Token{};
    }

    for (const Token& t : out.tokens)
    {
        if (EndsWithNewline(t.text))
            ++out.line_count;
    }
    // An unterminated last line still gets a number slot.
    if (!out.tokens.empty() && !EndsWithNewline(out.tokens.back().text))
        ++out.line_count;

    // 64-bit: a start near INT_MAX must not wrap.
    const long long start = std::max(1, opts.line_number_start);
    const long long largest = std::max(start, start + out.line_count - 1);
    out.width = DigitCount(largest);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------
LineState InitialLineState(const ExportOptions& opts)
{
    LineState s;
    s.lineno = std::max(1, opts.line_number_start);
    s.pending_number = true;
    return s;
}

bool RenderToken(const RenderContext& ctx,
                 LineState& state,
                 const Token& token,
                 std::string& out,
                 std::string& err,
                 ErrorCode* out_code)
{
    const rubric::tokens::TokenType effective = ctx.style->EffectiveType(token.type);
    const StyleRecord& st = ctx.style->StyleForToken(effective);

    if (ctx.line_numbers && state.pending_number)
    {
        const int width = std::max(1, ctx.line_number_width);
        std::string slot;
        if (IsNumberedLine(state.lineno, ctx.line_number_start, ctx.line_number_step))
            AppendInt(slot, state.lineno);
        if ((int)slot.size() < width)
            slot.insert(slot.begin(), (size_t)(width - (int)slot.size()), ' ');

        out += "{\\fs";
        AppendInt(out, ctx.line_number_font_size);
        out += " \\cf1 ";
        out += slot;
        out += "  }";
        state.pending_number = false;
        ++state.slots_written;
    }

    std::string prefix;
    auto color_ref = [&](const std::string& hex, const char* word) -> bool {
        const int idx = ctx.colors->IndexOf(hex);
        if (idx <= 0)
        {
            err = "Color '" + hex + "' of " + ctx.style->Tree().FullName(effective) + " is not in the color table.";
            SetCode(out_code, ErrorCode::UnknownColorReference);
            return false;
        }
        prefix += word;
        AppendInt(prefix, idx);
        return true;
    };

    if (!st.bgcolor.empty() && !color_ref(st.bgcolor, "\\cb"))
        return false;
    if (!st.color.empty() && !color_ref(st.color, "\\cf"))
        return false;
    if (st.bold)
        prefix += "\\b";
    if (st.italic)
        prefix += "\\i";
    if (st.underline)
        prefix += "\\ul";
    if (!st.border.empty() && !color_ref(st.border, "\\chbrdr\\chcfpat"))
        return false;

    if (!prefix.empty())
    {
        out += '{';
        out += prefix;
        out += ' ';
    }
    AppendEscapedText(token.text, out);
    if (!prefix.empty())
        out += '}';

    if (ctx.line_numbers && EndsWithNewline(token.text))
    {
        state.pending_number = true;
        ++state.lineno;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Export implementation
// ---------------------------------------------------------------------------
bool ExportTokensToString(TokenSource& src,
                          const Style& style,
                          std::string& out,
                          std::string& err,
                          const ExportOptions& options,
                          ExportStats* stats)
{
    err.clear();
    out.clear();

    ExportStats local;
    ExportStats& st = stats ? *stats : local;
    st = ExportStats{};

    ColorTable colors;
    if (!BuildColorTable(style, options, colors, err, &st.error))
        return false;
    st.colors = colors.entries.size();

    WriteHeader(options, colors, out);

    RenderContext ctx;
    ctx.style = &style;
    ctx.colors = &colors;
    ctx.line_numbers = options.line_numbers;
    ctx.line_number_font_size = options.line_number_font_size;
    ctx.line_number_start = std::max(1, options.line_number_start);
    ctx.line_number_step = std::max(1, options.line_number_step);

    LineState state = InitialLineState(options);

    auto render_all = [&](TokenSource& tokens) -> bool {
        Token tok;
        while (tokens.Next(tok))
        {
            if (!RenderToken(ctx, state, tok, out, err, &st.error))
                return false;
            ++st.tokens;
        }
        return true;
    };

    bool ok = false;
    if (options.line_numbers)
    {
        LinePrepassResult pre;
        LinePrepass(src, style.Tree(), options, pre);
        st.lines = pre.line_count;
        ctx.line_number_width = pre.width;

        rubric::tokens::VectorTokenSource materialized(pre.tokens);
        ok = render_all(materialized);
    }
    else
    {
        ok = render_all(src);
    }

    if (!ok)
    {
        out.clear();
        return false;
    }

    st.number_slots = state.slots_written;
    out += '}';
    return true;
}

bool ExportTokensToBytes(TokenSource& src,
                         const Style& style,
                         std::vector<std::uint8_t>& out_bytes,
                         std::string& err,
                         const ExportOptions& options,
                         ExportStats* stats)
{
    out_bytes.clear();
    std::string doc;
    if (!ExportTokensToString(src, style, doc, err, options, stats))
        return false;
    out_bytes.assign(doc.begin(), doc.end());
    return true;
}

bool ExportTokensToFile(const std::string& path,
                        TokenSource& src,
                        const Style& style,
                        std::string& err,
                        const ExportOptions& options,
                        ExportStats* stats)
{
    err.clear();
    std::string doc;
    if (!ExportTokensToString(src, style, doc, err, options, stats))
        return false;

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        err = "Failed to open file for writing.";
        if (stats)
            stats->error = ErrorCode::Io;
        return false;
    }
    if (!doc.empty())
        out.write(doc.data(), (std::streamsize)doc.size());
    if (!out)
    {
        err = "Failed to write file contents.";
        if (stats)
            stats->error = ErrorCode::Io;
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Presets
// ---------------------------------------------------------------------------
const std::vector<Preset>& Presets()
{
    static const std::vector<Preset> presets = []() {
        std::vector<Preset> v;
        v.reserve(4);

        {
            Preset p;
            p.id = PresetId::Plain;
            p.name = "Plain";
            p.description = "Highlighted runs only, viewer default font size.";
            v.push_back(p);
        }
        {
            Preset p;
            p.id = PresetId::Numbered;
            p.name = "Numbered";
            p.description = "Every line numbered, 9pt gutter.";
            p.export_.line_numbers = true;
            v.push_back(p);
        }
        {
            Preset p;
            p.id = PresetId::NumberedEvery5;
            p.name = "NumberedEvery5";
            p.description = "Numeral on lines 1, 6, 11, ...; blank padding in between.";
            p.export_.line_numbers = true;
            p.export_.line_number_step = 5;
            v.push_back(p);
        }
        return v;
    }();
    return presets;
}

const Preset* FindPreset(PresetId id)
{
    for (const auto& p : Presets())
    {
        if (p.id == id)
            return &p;
    }
    return nullptr;
}

const Preset* FindPresetByName(std::string_view name)
{
    const std::string want = ToLowerAscii(name);
    for (const auto& p : Presets())
    {
        if (ToLowerAscii(p.name) == want)
            return &p;
    }
    return nullptr;
}
} // namespace rtf
} // namespace formats
