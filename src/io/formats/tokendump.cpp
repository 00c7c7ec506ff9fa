#include "io/formats/tokendump.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <string>
#include <utility>

namespace formats::tokendump
{
const std::vector<std::string_view>& ImportExtensions()
{
    static const std::vector<std::string_view> exts = {"jsonl", "tokens", "json"};
    return exts;
}

namespace
{
using json = nlohmann::json;
using rubric::tokens::Token;
using rubric::tokens::TokenTypeTree;

static bool IsSpace(unsigned char c)
{
    return std::isspace(c) != 0;
}

static std::string_view TrimAscii(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && IsSpace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && IsSpace((unsigned char)s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

static bool TokenFromJson(const json& j, TokenTypeTree& tree, Token& out, std::string& err)
{
    if (!j.is_array() || j.size() != 2 || !j[0].is_string() || !j[1].is_string())
    {
        err = "Expected a [\"Category\", \"text\"] pair.";
        return false;
    }
    const std::string category = j[0].get<std::string>();
    const rubric::tokens::TokenType t = tree.Intern(category);
    if (t == rubric::tokens::kInvalid)
    {
        err = std::string("Invalid category name: ") + category;
        return false;
    }
    out.type = t;
    out.text = j[1].get<std::string>();
    return true;
}

// A document is an array of pairs when its first element is itself an array (or it is empty).
static bool LooksLikeArrayDocument(std::string_view s)
{
    s = TrimAscii(s);
    if (s.empty() || s[0] != '[')
        return false;
    s.remove_prefix(1);
    s = TrimAscii(s);
    return !s.empty() && (s[0] == '[' || s[0] == ']');
}

static std::vector<std::uint8_t> ReadAllBytes(const std::string& path, std::string& err)
{
    err.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "Failed to open file for reading.";
        return {};
    }
    in.seekg(0, std::ios::end);
    std::streamoff sz = in.tellg();
    if (sz < 0)
    {
        err = "Failed to read file size.";
        return {};
    }
    in.seekg(0, std::ios::beg);
    std::vector<std::uint8_t> out;
    out.resize((size_t)sz);
    if (sz > 0)
        in.read(reinterpret_cast<char*>(out.data()), sz);
    if (!in && sz > 0)
    {
        err = "Failed to read file contents.";
        return {};
    }
    return out;
}
} // namespace

bool ParseTokenPair(std::string_view line, TokenTypeTree& tree, Token& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(line.begin(), line.end());
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
    return TokenFromJson(j, tree, out, err);
}

JsonLinesTokenSource::JsonLinesTokenSource(std::istream& in, TokenTypeTree& tree)
    : m_in(&in)
    , m_tree(&tree)
{
}

bool JsonLinesTokenSource::Next(Token& out)
{
    if (Failed())
        return false;

    while (std::getline(*m_in, m_line))
    {
        ++m_line_no;
        const std::string_view line = TrimAscii(m_line);
        if (line.empty())
            continue;

        std::string e;
        if (!ParseTokenPair(line, *m_tree, out, e))
        {
            m_err = "line " + std::to_string(m_line_no) + ": " + e;
            return false;
        }
        return true;
    }
    if (m_in->bad())
        m_err = "Failed to read token stream.";
    return false;
}

bool ImportBytesToTokens(const std::vector<std::uint8_t>& bytes,
                         TokenTypeTree& tree,
                         std::vector<Token>& out_tokens,
                         std::string& err)
{
    err.clear();
    out_tokens.clear();

    const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    if (LooksLikeArrayDocument(text))
    {
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
        out_tokens.reserve(j.size());
        for (std::size_t i = 0; i < j.size(); ++i)
        {
            Token t;
            std::string e;
            if (!TokenFromJson(j[i], tree, t, e))
            {
                err = "token " + std::to_string(i) + ": " + e;
                return false;
            }
            out_tokens.push_back(std::move(t));
        }
        return true;
    }

    std::size_t pos = 0;
    std::size_t line_no = 0;
    while (pos < text.size())
    {
        std::size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos)
            nl = text.size();
        const std::string_view line = TrimAscii(text.substr(pos, nl - pos));
        pos = nl + 1;
        ++line_no;
        if (line.empty())
            continue;

        Token t;
        std::string e;
        if (!ParseTokenPair(line, tree, t, e))
        {
            err = "line " + std::to_string(line_no) + ": " + e;
            return false;
        }
        out_tokens.push_back(std::move(t));
    }
    return true;
}

bool ImportFileToTokens(const std::string& path,
                        TokenTypeTree& tree,
                        std::vector<Token>& out_tokens,
                        std::string& err)
{
    std::vector<std::uint8_t> bytes = ReadAllBytes(path, err);
    if (!err.empty())
        return false;
    return ImportBytesToTokens(bytes, tree, out_tokens, err);
}
} // namespace formats::tokendump
