#pragma once

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace scribe {

// ---------------------------------------------------------------------------
// SequenceMatcher<Seq>: longest-matching-block alignment of two sequences
// (lines as std::vector<std::string>, characters as std::string)
// ---------------------------------------------------------------------------

enum class OpTag { Equal, Replace, Delete, Insert };

struct Opcode {
    OpTag tag;
    size_t i1, i2;   // range in a
    size_t j1, j2;   // range in b
};

template<typename Seq>
class SequenceMatcher {
public:
    using Elem = typename Seq::value_type;
    using JunkFn = std::function<bool(const Elem&)>;

    struct Block {
        size_t a;
        size_t b;
        size_t size;

        bool operator<(const Block& o) const {
            return std::tie(a, b, size) < std::tie(o.a, o.b, o.size);
        }
    };

    explicit SequenceMatcher(JunkFn isjunk = nullptr, bool autojunk = true)
        : isjunk_(std::move(isjunk)), autojunk_(autojunk) {
        chain_b();
    }

    SequenceMatcher(const Seq& a, const Seq& b, JunkFn isjunk = nullptr,
                    bool autojunk = true)
        : a_(a), b_(b), isjunk_(std::move(isjunk)), autojunk_(autojunk) {
        chain_b();
    }

    void set_seqs(const Seq& a, const Seq& b) {
        set_seq1(a);
        set_seq2(b);
    }

    void set_seq1(const Seq& a) {
        a_ = a;
        blocks_.reset();
        opcodes_.reset();
    }

    // Indexing b is the expensive part; callers vary a in inner loops
    void set_seq2(const Seq& b) {
        b_ = b;
        blocks_.reset();
        opcodes_.reset();
        fullbcount_.reset();
        chain_b();
    }

    // Longest block a[i:i+k] == b[j:j+k] inside the given ranges.
    // Ties go to the earliest i, then the earliest j; junk elements only
    // extend a block at its edges.
    Block find_longest_match(size_t alo, size_t ahi, size_t blo, size_t bhi) const {
        size_t besti = alo, bestj = blo, bestsize = 0;

        std::unordered_map<size_t, size_t> j2len;
        for (size_t i = alo; i < ahi; ++i) {
            std::unordered_map<size_t, size_t> newj2len;
            auto it = b2j_.find(a_[i]);
            if (it != b2j_.end()) {
                for (size_t j : it->second) {
                    if (j < blo) continue;
                    if (j >= bhi) break;
                    size_t prev = 0;
                    if (j > 0) {
                        auto p = j2len.find(j - 1);
                        if (p != j2len.end()) prev = p->second;
                    }
                    size_t k = prev + 1;
                    newj2len[j] = k;
                    if (k > bestsize) {
                        besti = i + 1 - k;
                        bestj = j + 1 - k;
                        bestsize = k;
                    }
                }
            }
            j2len.swap(newj2len);
        }

        // Extend with equal non-junk neighbours, then with junk ones
        for (bool junk : {false, true}) {
            while (besti > alo && bestj > blo &&
                   is_bjunk(b_[bestj - 1]) == junk &&
                   a_[besti - 1] == b_[bestj - 1]) {
                --besti;
                --bestj;
                ++bestsize;
            }
            while (besti + bestsize < ahi && bestj + bestsize < bhi &&
                   is_bjunk(b_[bestj + bestsize]) == junk &&
                   a_[besti + bestsize] == b_[bestj + bestsize]) {
                ++bestsize;
            }
        }
        return {besti, bestj, bestsize};
    }

    // Non-overlapping increasing blocks, ending with the sentinel {la, lb, 0}
    const std::vector<Block>& matching_blocks() {
        if (blocks_) return *blocks_;

        size_t la = a_.size(), lb = b_.size();
        std::vector<std::tuple<size_t, size_t, size_t, size_t>> queue;
        queue.emplace_back(0, la, 0, lb);
        std::vector<Block> found;
        while (!queue.empty()) {
            auto [alo, ahi, blo, bhi] = queue.back();
            queue.pop_back();
            Block x = find_longest_match(alo, ahi, blo, bhi);
            if (x.size == 0) continue;
            found.push_back(x);
            if (alo < x.a && blo < x.b) {
                queue.emplace_back(alo, x.a, blo, x.b);
            }
            if (x.a + x.size < ahi && x.b + x.size < bhi) {
                queue.emplace_back(x.a + x.size, ahi, x.b + x.size, bhi);
            }
        }
        std::sort(found.begin(), found.end());

        // Collapse adjacent blocks
        std::vector<Block> merged;
        Block cur{0, 0, 0};
        for (const auto& blk : found) {
            if (cur.a + cur.size == blk.a && cur.b + cur.size == blk.b) {
                cur.size += blk.size;
            } else {
                if (cur.size) merged.push_back(cur);
                cur = blk;
            }
        }
        if (cur.size) merged.push_back(cur);
        merged.push_back({la, lb, 0});

        blocks_ = std::move(merged);
        return *blocks_;
    }

    const std::vector<Opcode>& opcodes() {
        if (opcodes_) return *opcodes_;

        std::vector<Opcode> out;
        size_t i = 0, j = 0;
        for (const auto& blk : matching_blocks()) {
            if (i < blk.a && j < blk.b) {
                out.push_back({OpTag::Replace, i, blk.a, j, blk.b});
            } else if (i < blk.a) {
                out.push_back({OpTag::Delete, i, blk.a, j, blk.b});
            } else if (j < blk.b) {
                out.push_back({OpTag::Insert, i, blk.a, j, blk.b});
            }
            i = blk.a + blk.size;
            j = blk.b + blk.size;
            if (blk.size) {
                out.push_back({OpTag::Equal, blk.a, i, blk.b, j});
            }
        }
        opcodes_ = std::move(out);
        return *opcodes_;
    }

    // Hunks of changes with up to `n` lines of context on each side
    std::vector<std::vector<Opcode>> grouped_opcodes(size_t n = 3) {
        std::vector<Opcode> codes = opcodes();
        if (codes.empty()) {
            codes.push_back({OpTag::Equal, 0, 1, 0, 1});
        }
        if (codes.front().tag == OpTag::Equal) {
            auto& c = codes.front();
            c.i1 = std::max(c.i1, c.i2 > n ? c.i2 - n : 0);
            c.j1 = std::max(c.j1, c.j2 > n ? c.j2 - n : 0);
        }
        if (codes.back().tag == OpTag::Equal) {
            auto& c = codes.back();
            c.i2 = std::min(c.i2, c.i1 + n);
            c.j2 = std::min(c.j2, c.j1 + n);
        }

        std::vector<std::vector<Opcode>> groups;
        std::vector<Opcode> group;
        for (Opcode c : codes) {
            if (c.tag == OpTag::Equal && c.i2 - c.i1 > 2 * n) {
                group.push_back({OpTag::Equal, c.i1, std::min(c.i2, c.i1 + n),
                                 c.j1, std::min(c.j2, c.j1 + n)});
                groups.push_back(std::move(group));
                group.clear();
                c.i1 = std::max(c.i1, c.i2 - n);
                c.j1 = std::max(c.j1, c.j2 - n);
            }
            group.push_back(c);
        }
        if (!group.empty() &&
            !(group.size() == 1 && group.front().tag == OpTag::Equal)) {
            groups.push_back(std::move(group));
        }
        return groups;
    }

    double ratio() {
        size_t matches = 0;
        for (const auto& blk : matching_blocks()) matches += blk.size;
        return calculate_ratio(matches);
    }

    // Upper bound on ratio() from element counts alone
    double quick_ratio() {
        if (!fullbcount_) {
            fullbcount_.emplace();
            for (const auto& e : b_) ++(*fullbcount_)[e];
        }
        std::unordered_map<Elem, long> avail;
        size_t matches = 0;
        for (const auto& e : a_) {
            long numb;
            auto it = avail.find(e);
            if (it != avail.end()) {
                numb = it->second;
            } else {
                auto f = fullbcount_->find(e);
                numb = (f == fullbcount_->end()) ? 0 : f->second;
            }
            avail[e] = numb - 1;
            if (numb > 0) ++matches;
        }
        return calculate_ratio(matches);
    }

    // Upper bound on ratio() from the lengths alone
    double real_quick_ratio() const {
        return calculate_ratio(std::min(a_.size(), b_.size()));
    }

    const Seq& a() const { return a_; }
    const Seq& b() const { return b_; }

private:
    Seq a_;
    Seq b_;
    JunkFn isjunk_;
    bool autojunk_;

    std::unordered_map<Elem, std::vector<size_t>> b2j_;
    std::unordered_set<Elem> bjunk_;
    std::unordered_set<Elem> bpopular_;
    std::optional<std::vector<Block>> blocks_;
    std::optional<std::vector<Opcode>> opcodes_;
    std::optional<std::unordered_map<Elem, long>> fullbcount_;

    bool is_bjunk(const Elem& e) const {
        return bjunk_.count(e) > 0;
    }

    double calculate_ratio(size_t matches) const {
        size_t length = a_.size() + b_.size();
        if (length == 0) return 1.0;
        return 2.0 * static_cast<double>(matches) / static_cast<double>(length);
    }

    // Index b; junk and (for long sequences) very popular elements are
    // left out so they cannot seed a match
    void chain_b() {
        b2j_.clear();
        bjunk_.clear();
        bpopular_.clear();
        for (size_t i = 0; i < b_.size(); ++i) {
            b2j_[b_[i]].push_back(i);
        }

        if (isjunk_) {
            for (const auto& [elem, idx] : b2j_) {
                if (isjunk_(elem)) bjunk_.insert(elem);
            }
            for (const auto& elem : bjunk_) b2j_.erase(elem);
        }

        size_t n = b_.size();
        if (autojunk_ && n >= 200) {
            size_t ntest = n / 100 + 1;
            for (const auto& [elem, idx] : b2j_) {
                if (idx.size() > ntest) bpopular_.insert(elem);
            }
            for (const auto& elem : bpopular_) b2j_.erase(elem);
        }
    }
};

using LineMatcher = SequenceMatcher<std::vector<std::string>>;
using CharMatcher = SequenceMatcher<std::string>;

} // namespace scribe
