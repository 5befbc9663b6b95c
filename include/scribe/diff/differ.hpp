#pragma once

#include <scribe/diff/sequence_matcher.hpp>
#include <string>
#include <vector>

namespace scribe {

using Lines = std::vector<std::string>;

// Split on '\n'; a trailing newline does not start an extra empty line
Lines split_lines(const std::string& text);

// Hunks headed by "@@ -a,b +c,d @@" with ' ', '-' and '+' line prefixes
Lines unified_diff(const Lines& a, const Lines& b, size_t context = 3);

// Hunks separated by "***************", with "*** a,b ****" and
// "--- c,d ----" sections and ' ', '!', '-', '+' line prefixes
Lines context_diff(const Lines& a, const Lines& b, size_t context = 3);

// Every line prefixed by "  ", "- " or "+ "; similar line pairs get
// "? " guide lines marking changed columns with '^', '-' and '+'
Lines ndiff(const Lines& a, const Lines& b);

} // namespace scribe
