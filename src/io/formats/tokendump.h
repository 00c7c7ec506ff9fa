#pragma once

#include "core/token_types.h"

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

// Token dump format module (import).
//
// Tokens arrive pre-classified from an external lexer in one of two JSON shapes:
// - JSON lines: one `["Category.Name", "text"]` pair per line (streamed lazily).
// - JSON array: a single `[["Keyword", "if"], ["Text", " "], ...]` document.
//
// Category names may carry the "Token." prefix; unknown names are interned into the tree.
namespace formats::tokendump
{
// Lowercase extensions (no leading dot).
const std::vector<std::string_view>& ImportExtensions(); // {"jsonl", "tokens", "json"}

// Forward-only source over a JSON lines stream. Holds at most one line in memory.
//
// A malformed line ends the stream; Failed() then reports true and Error() the reason
// (with the 1-based line number).
class JsonLinesTokenSource : public rubric::tokens::TokenSource
{
public:
    JsonLinesTokenSource(std::istream& in, rubric::tokens::TokenTypeTree& tree);

    bool Next(rubric::tokens::Token& out) override;

    bool Failed() const { return !m_err.empty(); }
    const std::string& Error() const { return m_err; }
    std::size_t LineNumber() const { return m_line_no; }

private:
    std::istream* m_in = nullptr;
    rubric::tokens::TokenTypeTree* m_tree = nullptr;
    std::string m_line;
    std::string m_err;
    std::size_t m_line_no = 0;
};

// Parses one `["Category", "text"]` pair.
bool ParseTokenPair(std::string_view line,
                    rubric::tokens::TokenTypeTree& tree,
                    rubric::tokens::Token& out,
                    std::string& err);

// Accepts either shape: a top-level JSON array of pairs, or JSON lines.
bool ImportBytesToTokens(const std::vector<std::uint8_t>& bytes,
                         rubric::tokens::TokenTypeTree& tree,
                         std::vector<rubric::tokens::Token>& out_tokens,
                         std::string& err);

bool ImportFileToTokens(const std::string& path,
                        rubric::tokens::TokenTypeTree& tree,
                        std::vector<rubric::tokens::Token>& out_tokens,
                        std::string& err);
} // namespace formats::tokendump
