#include <scribe/diff/differ.hpp>
#include <cctype>

namespace scribe {

Lines split_lines(const std::string& text) {
    Lines lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// ---------------------------------------------------------------------------
// Unified and context formats
// ---------------------------------------------------------------------------

// "start,length" with 1-based start; an empty range names the line before it
static std::string unified_range(size_t start, size_t stop) {
    size_t length = stop - start;
    size_t beginning = length ? start + 1 : start;
    return std::to_string(beginning) + "," + std::to_string(length);
}

// "first,last" with 1-based lines; an empty range names the line before it
static std::string context_range(size_t start, size_t stop) {
    size_t length = stop - start;
    if (length == 0) {
        return std::to_string(start) + "," + std::to_string(start);
    }
    return std::to_string(start + 1) + "," + std::to_string(start + length);
}

Lines unified_diff(const Lines& a, const Lines& b, size_t context) {
    Lines out;
    LineMatcher matcher(a, b);
    for (const auto& group : matcher.grouped_opcodes(context)) {
        const auto& first = group.front();
        const auto& last = group.back();
        out.push_back("@@ -" + unified_range(first.i1, last.i2) +
                      " +" + unified_range(first.j1, last.j2) + " @@");
        for (const auto& op : group) {
            if (op.tag == OpTag::Equal) {
                for (size_t i = op.i1; i < op.i2; ++i) out.push_back(" " + a[i]);
                continue;
            }
            if (op.tag == OpTag::Replace || op.tag == OpTag::Delete) {
                for (size_t i = op.i1; i < op.i2; ++i) out.push_back("-" + a[i]);
            }
            if (op.tag == OpTag::Replace || op.tag == OpTag::Insert) {
                for (size_t j = op.j1; j < op.j2; ++j) out.push_back("+" + b[j]);
            }
        }
    }
    return out;
}

static const char* context_prefix(OpTag tag) {
    switch (tag) {
    case OpTag::Insert:  return "+ ";
    case OpTag::Delete:  return "- ";
    case OpTag::Replace: return "! ";
    case OpTag::Equal:   return "  ";
    }
    return "  ";
}

Lines context_diff(const Lines& a, const Lines& b, size_t context) {
    Lines out;
    LineMatcher matcher(a, b);
    for (const auto& group : matcher.grouped_opcodes(context)) {
        out.push_back("***************");

        out.push_back("*** " + context_range(group.front().i1, group.back().i2) + " ****");
        bool removes = false;
        for (const auto& op : group) {
            if (op.tag == OpTag::Replace || op.tag == OpTag::Delete) removes = true;
        }
        if (removes) {
            for (const auto& op : group) {
                if (op.tag == OpTag::Insert) continue;
                for (size_t i = op.i1; i < op.i2; ++i) {
                    out.push_back(context_prefix(op.tag) + a[i]);
                }
            }
        }

        out.push_back("--- " + context_range(group.front().j1, group.back().j2) + " ----");
        bool adds = false;
        for (const auto& op : group) {
            if (op.tag == OpTag::Replace || op.tag == OpTag::Insert) adds = true;
        }
        if (adds) {
            for (const auto& op : group) {
                if (op.tag == OpTag::Delete) continue;
                for (size_t j = op.j1; j < op.j2; ++j) {
                    out.push_back(context_prefix(op.tag) + b[j]);
                }
            }
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// ndiff
// ---------------------------------------------------------------------------

namespace {

bool is_character_junk(const char& c) {
    return c == ' ' || c == '\t';
}

struct Ndiff {
    const Lines& a;
    const Lines& b;
    Lines out;

    Ndiff(const Lines& x, const Lines& y) : a(x), b(y) {}

    void dump(const char* tag, const Lines& x, size_t lo, size_t hi) {
        for (size_t i = lo; i < hi; ++i) out.push_back(std::string(tag) + x[i]);
    }

    void plain_replace(size_t alo, size_t ahi, size_t blo, size_t bhi) {
        // Dump the shorter block first
        if (bhi - blo < ahi - alo) {
            dump("+ ", b, blo, bhi);
            dump("- ", a, alo, ahi);
        } else {
            dump("- ", a, alo, ahi);
            dump("+ ", b, blo, bhi);
        }
    }

    // Keep tabs and spaces of the original line under unchanged columns
    static std::string keep_original_ws(const std::string& s, const std::string& tags) {
        std::string out;
        for (size_t i = 0; i < s.size() && i < tags.size(); ++i) {
            bool ws = std::isspace(static_cast<unsigned char>(s[i])) != 0;
            out += (tags[i] == ' ' && ws) ? s[i] : tags[i];
        }
        return out;
    }

    static std::string rstrip(std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    }

    void qformat(const std::string& aline, const std::string& bline,
                 const std::string& atags, const std::string& btags) {
        std::string aguide = rstrip(keep_original_ws(aline, atags));
        std::string bguide = rstrip(keep_original_ws(bline, btags));
        out.push_back("- " + aline);
        if (!aguide.empty()) out.push_back("? " + aguide);
        out.push_back("+ " + bline);
        if (!bguide.empty()) out.push_back("? " + bguide);
    }

    void helper(size_t alo, size_t ahi, size_t blo, size_t bhi) {
        if (alo < ahi) {
            if (blo < bhi) {
                fancy_replace(alo, ahi, blo, bhi);
            } else {
                dump("- ", a, alo, ahi);
            }
        } else if (blo < bhi) {
            dump("+ ", b, blo, bhi);
        }
    }

    // Pair up the most similar lines of a replaced block and mark their
    // intraline differences; recurse on what lies before and after the pair
    void fancy_replace(size_t alo, size_t ahi, size_t blo, size_t bhi) {
        const double cutoff = 0.75;
        double best_ratio = 0.74;
        size_t best_i = 0, best_j = 0;
        bool have_eq = false;
        size_t eqi = 0, eqj = 0;

        CharMatcher cruncher(is_character_junk);
        for (size_t j = blo; j < bhi; ++j) {
            cruncher.set_seq2(b[j]);
            for (size_t i = alo; i < ahi; ++i) {
                if (a[i] == b[j]) {
                    if (!have_eq) {
                        have_eq = true;
                        eqi = i;
                        eqj = j;
                    }
                    continue;
                }
                cruncher.set_seq1(a[i]);
                if (cruncher.real_quick_ratio() > best_ratio &&
                    cruncher.quick_ratio() > best_ratio &&
                    cruncher.ratio() > best_ratio) {
                    best_ratio = cruncher.ratio();
                    best_i = i;
                    best_j = j;
                }
            }
        }

        if (best_ratio < cutoff) {
            if (!have_eq) {
                plain_replace(alo, ahi, blo, bhi);
                return;
            }
            best_i = eqi;
            best_j = eqj;
        } else {
            have_eq = false;
        }

        helper(alo, best_i, blo, best_j);

        const std::string& aelt = a[best_i];
        const std::string& belt = b[best_j];
        if (!have_eq) {
            std::string atags, btags;
            cruncher.set_seqs(aelt, belt);
            for (const auto& op : cruncher.opcodes()) {
                size_t la = op.i2 - op.i1;
                size_t lb = op.j2 - op.j1;
                switch (op.tag) {
                case OpTag::Replace:
                    atags.append(la, '^');
                    btags.append(lb, '^');
                    break;
                case OpTag::Delete:
                    atags.append(la, '-');
                    break;
                case OpTag::Insert:
                    btags.append(lb, '+');
                    break;
                case OpTag::Equal:
                    atags.append(la, ' ');
                    btags.append(lb, ' ');
                    break;
                }
            }
            qformat(aelt, belt, atags, btags);
        } else {
            out.push_back("  " + aelt);
        }

        helper(best_i + 1, ahi, best_j + 1, bhi);
    }

    Lines run() {
        LineMatcher matcher(a, b);
        for (const auto& op : matcher.opcodes()) {
            switch (op.tag) {
            case OpTag::Replace: fancy_replace(op.i1, op.i2, op.j1, op.j2); break;
            case OpTag::Delete:  dump("- ", a, op.i1, op.i2); break;
            case OpTag::Insert:  dump("+ ", b, op.j1, op.j2); break;
            case OpTag::Equal:   dump("  ", a, op.i1, op.i2); break;
            }
        }
        return std::move(out);
    }
};

} // anonymous namespace

Lines ndiff(const Lines& a, const Lines& b) {
    Ndiff differ(a, b);
    return differ.run();
}

} // namespace scribe
