#pragma once

#include <cstddef>

namespace rubric::utf8
{
// Decodes one scalar starting at data[i] and advances i past it.
// On a malformed sequence, advances by one byte and returns false.
bool DecodeOne(const char* data, std::size_t len, std::size_t& i, char32_t& out_cp);
} // namespace rubric::utf8
