#pragma once

#include <string>
#include <vector>

namespace uaver {

// Canonical form used by version_compare-style ordering: every boundary
// between digits, letters and punctuation is a single '.', and numeric
// tokens lose redundant leading zeros ("1.02-03alpha" -> "1.2.3.alpha").
//
// Only ASCII is classified. Bytes >= 0x80 count as punctuation.
std::string canonicalize(const std::string& version);

// Splits a canonical string on every '.', keeping empty fields.
// "" -> {""}, "." -> {"", ""}
std::vector<std::string> split_canonical(const std::string& canonical);

// The individual rewrite passes, in the order canonicalize() applies them.
// Each one behaves like a global, non-overlapping, leftmost substitution over
// its whole input. The order matters: reordering changes the result on
// inputs mixing digits, letters and punctuation.
namespace passes {

// '-', '_' and '+' -> '.'
std::string separators_to_dots(const std::string& s);

// "a1" -> "a.1" (non-digit, non-dot followed by a digit)
std::string split_alpha_digit(const std::string& s);

// "1a" -> "1.a" (digit followed by non-digit, non-dot)
std::string split_digit_alpha(const std::string& s);

// "1|" -> "1.|" (alphanumeric followed by anything else)
std::string split_alnum_punct(const std::string& s);

// "|1" -> "|.1" (non-alphanumeric followed by alphanumeric)
std::string split_punct_alnum(const std::string& s);

// "^0+" or "\.0+" -> "0". The anchoring dot is consumed.
std::string collapse_zero_runs(const std::string& s);

// "^0(\d+)" or "\.0(\d+)" -> the digits. The anchoring dot is consumed.
std::string strip_leading_zero(const std::string& s);

// ".." and longer dot runs -> "."
std::string collapse_dots(const std::string& s);

} // namespace passes

} // namespace uaver
