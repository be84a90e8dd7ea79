#include <topbase-cpp/diff.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace topbase_cpp {

namespace {

enum class EditOp : std::uint8_t { keep, insert, remove };

// One step of an edit script, with the old/new line positions in effect
// before the step is taken.
struct Edit {
    EditOp op;
    std::size_t a_pos;
    std::size_t b_pos;
};

// Myers' O(ND) shortest edit script between a[lo_a, hi_a) and b[lo_b, hi_b).
// Appends keep/insert/remove ops (without positions) in forward order.
void myers(const std::vector<std::string>& a, std::size_t lo_a, std::size_t hi_a,
           const std::vector<std::string>& b, std::size_t lo_b, std::size_t hi_b,
           std::vector<EditOp>& out) {
    const auto n = static_cast<std::ptrdiff_t>(hi_a - lo_a);
    const auto m = static_cast<std::ptrdiff_t>(hi_b - lo_b);
    const auto max = n + m;
    if (max == 0) return;

    const auto offset = max;
    auto v = std::vector<std::ptrdiff_t>(static_cast<std::size_t>(2 * max + 2), 0);
    auto trace = std::vector<std::vector<std::ptrdiff_t>>{};

    auto at = [&](std::vector<std::ptrdiff_t>& vec, std::ptrdiff_t k) -> std::ptrdiff_t& {
        return vec[static_cast<std::size_t>(offset + k)];
    };
    auto equal = [&](std::ptrdiff_t x, std::ptrdiff_t y) {
        return a[lo_a + static_cast<std::size_t>(x)] == b[lo_b + static_cast<std::size_t>(y)];
    };

    auto done = false;
    for (std::ptrdiff_t d = 0; d <= max && !done; ++d) {
        trace.push_back(v);
        for (std::ptrdiff_t k = -d; k <= d; k += 2) {
            auto x = std::ptrdiff_t{0};
            if (k == -d || (k != d && at(v, k - 1) < at(v, k + 1))) {
                x = at(v, k + 1);
            } else {
                x = at(v, k - 1) + 1;
            }
            auto y = x - k;
            while (x < n && y < m && equal(x, y)) {
                ++x;
                ++y;
            }
            at(v, k) = x;
            if (x >= n && y >= m) {
                done = true;
                break;
            }
        }
    }

    // Walk the trace backwards to recover the path
    auto reversed = std::vector<EditOp>{};
    auto x = n;
    auto y = m;
    for (auto d = static_cast<std::ptrdiff_t>(trace.size()) - 1; d >= 0; --d) {
        auto& vd = trace[static_cast<std::size_t>(d)];
        const auto k = x - y;
        auto prev_k = std::ptrdiff_t{0};
        if (k == -d || (k != d && at(vd, k - 1) < at(vd, k + 1))) {
            prev_k = k + 1;
        } else {
            prev_k = k - 1;
        }
        const auto prev_x = at(vd, prev_k);
        const auto prev_y = prev_x - prev_k;

        while (x > prev_x && y > prev_y) {
            reversed.push_back(EditOp::keep);
            --x;
            --y;
        }
        if (d > 0) {
            reversed.push_back(x == prev_x ? EditOp::insert : EditOp::remove);
        }
        x = prev_x;
        y = prev_y;
    }
    out.insert(out.end(), reversed.rbegin(), reversed.rend());
}

// Edit script with positions; common prefix and suffix are peeled off
// before running Myers to keep the trace small.
auto edit_script(const std::vector<std::string>& a,
                 const std::vector<std::string>& b) -> std::vector<Edit> {
    auto prefix = std::size_t{0};
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    auto suffix = std::size_t{0};
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    auto ops = std::vector<EditOp>(prefix, EditOp::keep);
    myers(a, prefix, a.size() - suffix, b, prefix, b.size() - suffix, ops);
    ops.insert(ops.end(), suffix, EditOp::keep);

    auto edits = std::vector<Edit>{};
    edits.reserve(ops.size());
    auto a_pos = std::size_t{0};
    auto b_pos = std::size_t{0};
    for (auto op : ops) {
        edits.push_back(Edit{.op = op, .a_pos = a_pos, .b_pos = b_pos});
        if (op != EditOp::insert) ++a_pos;
        if (op != EditOp::remove) ++b_pos;
    }
    return edits;
}

// Lines [first, last) of an edit script as hunk lines. Within every
// run of consecutive changes, deletions are emitted before additions so
// the same change always reads the same way.
auto hunk_lines(const std::vector<Edit>& edits, std::size_t first, std::size_t last,
                const std::vector<std::string>& a,
                const std::vector<std::string>& b) -> std::vector<DiffLine> {
    auto lines = std::vector<DiffLine>{};
    auto additions = std::vector<DiffLine>{};
    auto flush = [&] {
        std::ranges::move(additions, std::back_inserter(lines));
        additions.clear();
    };
    for (auto i = first; i < last; ++i) {
        const auto& e = edits[i];
        switch (e.op) {
            case EditOp::keep:
                flush();
                lines.push_back(DiffLine{.origin = LineOrigin::context, .text = a[e.a_pos]});
                break;
            case EditOp::remove:
                lines.push_back(DiffLine{.origin = LineOrigin::deletion, .text = a[e.a_pos]});
                break;
            case EditOp::insert:
                additions.push_back(DiffLine{.origin = LineOrigin::addition, .text = b[e.b_pos]});
                break;
        }
    }
    flush();
    return lines;
}

auto lines_match(const std::vector<std::string>& base, std::size_t pos,
                 const std::vector<const std::string*>& block) -> bool {
    if (pos + block.size() > base.size()) return false;
    for (std::size_t i = 0; i < block.size(); ++i) {
        if (base[pos + i] != *block[i]) return false;
    }
    return true;
}

auto join(const std::vector<std::string>& lines) -> std::string {
    auto out = std::string{};
    for (const auto& l : lines) out += l;
    return out;
}

}  // anonymous namespace

// -- Hunk ---------------------------------------------------------------------

auto Hunk::old_count() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(lines, [](const DiffLine& l) {
        return l.origin != LineOrigin::addition;
    }));
}

auto Hunk::new_count() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(lines, [](const DiffLine& l) {
        return l.origin != LineOrigin::deletion;
    }));
}

// -- Diffing ------------------------------------------------------------------

auto split_lines(std::string_view text) -> std::vector<std::string> {
    auto lines = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

auto diff_lines(const std::vector<std::string>& before,
                const std::vector<std::string>& after,
                std::size_t context) -> std::vector<Hunk> {
    const auto edits = edit_script(before, after);

    auto changes = std::vector<std::size_t>{};
    for (std::size_t i = 0; i < edits.size(); ++i) {
        if (edits[i].op != EditOp::keep) changes.push_back(i);
    }

    auto hunks = std::vector<Hunk>{};
    auto g = std::size_t{0};
    while (g < changes.size()) {
        // Extend the group while the gap between changes fits two contexts
        auto end = g;
        while (end + 1 < changes.size() &&
               changes[end + 1] - changes[end] - 1 <= 2 * context) {
            ++end;
        }
        const auto first = changes[g] >= context ? changes[g] - context : 0;
        const auto last = std::min(edits.size(), changes[end] + context + 1);

        hunks.push_back(Hunk{
            .old_start = edits[first].a_pos,
            .new_start = edits[first].b_pos,
            .lines = hunk_lines(edits, first, last, before, after),
        });
        g = end + 1;
    }
    return hunks;
}

auto diff_trees(const Tree& before, const Tree& after, std::size_t context) -> TreeDiff {
    auto result = TreeDiff{};
    auto it_a = before.begin();
    auto it_b = after.begin();

    while (it_a != before.end() || it_b != after.end()) {
        if (it_b == after.end() || (it_a != before.end() && it_a->first < it_b->first)) {
            result.push_back(FileDelta{
                .path = it_a->first,
                .kind = DeltaKind::deleted,
                .old_mode = it_a->second.mode,
                .new_mode = std::nullopt,
                .hunks = diff_lines(split_lines(it_a->second.content), {}, context),
            });
            ++it_a;
        } else if (it_a == before.end() || it_b->first < it_a->first) {
            result.push_back(FileDelta{
                .path = it_b->first,
                .kind = DeltaKind::added,
                .old_mode = std::nullopt,
                .new_mode = it_b->second.mode,
                .hunks = diff_lines({}, split_lines(it_b->second.content), context),
            });
            ++it_b;
        } else {
            if (it_a->second != it_b->second) {
                auto hunks = std::vector<Hunk>{};
                if (it_a->second.content != it_b->second.content) {
                    hunks = diff_lines(split_lines(it_a->second.content),
                                       split_lines(it_b->second.content), context);
                }
                result.push_back(FileDelta{
                    .path = it_a->first,
                    .kind = DeltaKind::modified,
                    .old_mode = it_a->second.mode,
                    .new_mode = it_b->second.mode,
                    .hunks = std::move(hunks),
                });
            }
            ++it_a;
            ++it_b;
        }
    }
    return result;
}

// -- Applying -----------------------------------------------------------------

auto apply_hunks(std::string_view content, const std::vector<Hunk>& hunks)
    -> std::optional<std::string> {
    const auto base = split_lines(content);
    auto out = std::vector<std::string>{};
    out.reserve(base.size());

    auto cursor = std::size_t{0};
    auto shift = std::ptrdiff_t{0};

    for (const auto& hunk : hunks) {
        auto old_block = std::vector<const std::string*>{};
        for (const auto& l : hunk.lines) {
            if (l.origin != LineOrigin::addition) old_block.push_back(&l.text);
        }
        if (cursor + old_block.size() > base.size()) return std::nullopt;
        const auto last_pos = base.size() - old_block.size();

        auto expected = static_cast<std::ptrdiff_t>(hunk.old_start) + shift;
        expected = std::clamp(expected, static_cast<std::ptrdiff_t>(cursor),
                              static_cast<std::ptrdiff_t>(last_pos));

        // Search outward from the expected position
        auto found = std::optional<std::size_t>{};
        const auto lo = static_cast<std::ptrdiff_t>(cursor);
        const auto hi = static_cast<std::ptrdiff_t>(last_pos);
        for (std::ptrdiff_t dist = 0; !found; ++dist) {
            const auto before = expected - dist;
            const auto after = expected + dist;
            if (before < lo && after > hi) break;
            if (before >= lo && lines_match(base, static_cast<std::size_t>(before), old_block)) {
                found = static_cast<std::size_t>(before);
            } else if (dist > 0 && after <= hi &&
                       lines_match(base, static_cast<std::size_t>(after), old_block)) {
                found = static_cast<std::size_t>(after);
            }
        }
        if (!found) return std::nullopt;

        out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(cursor),
                   base.begin() + static_cast<std::ptrdiff_t>(*found));
        for (const auto& l : hunk.lines) {
            if (l.origin != LineOrigin::deletion) out.push_back(l.text);
        }
        cursor = *found + old_block.size();
        shift = static_cast<std::ptrdiff_t>(*found) - static_cast<std::ptrdiff_t>(hunk.old_start);
    }

    out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(cursor), base.end());
    return join(out);
}

auto apply_diff(const Tree& base, const TreeDiff& diff) -> std::variant<Tree, ApplyConflict> {
    auto tree = base;
    for (const auto& delta : diff) {
        auto it = tree.find(delta.path);
        switch (delta.kind) {
            case DeltaKind::added: {
                if (it != tree.end()) {
                    return ApplyConflict{.path = delta.path, .reason = "file already exists"};
                }
                auto content = apply_hunks({}, delta.hunks);
                if (!content) {
                    return ApplyConflict{.path = delta.path, .reason = "added content does not apply"};
                }
                tree.emplace(delta.path, FileEntry{
                    .mode = delta.new_mode.value_or(FileMode::regular),
                    .content = std::move(*content),
                });
                break;
            }
            case DeltaKind::deleted: {
                if (it == tree.end()) {
                    return ApplyConflict{.path = delta.path, .reason = "file to delete does not exist"};
                }
                auto remaining = apply_hunks(it->second.content, delta.hunks);
                if (!remaining || !remaining->empty()) {
                    return ApplyConflict{.path = delta.path, .reason = "file to delete has different content"};
                }
                tree.erase(it);
                break;
            }
            case DeltaKind::modified: {
                if (it == tree.end()) {
                    return ApplyConflict{.path = delta.path, .reason = "file to modify does not exist"};
                }
                auto& entry = it->second;
                if (delta.old_mode && delta.new_mode && *delta.old_mode != *delta.new_mode &&
                    entry.mode != *delta.old_mode && entry.mode != *delta.new_mode) {
                    return ApplyConflict{.path = delta.path, .reason = "mode changed on both sides"};
                }
                auto content = apply_hunks(entry.content, delta.hunks);
                if (!content) {
                    return ApplyConflict{.path = delta.path, .reason = "hunk does not apply"};
                }
                entry.content = std::move(*content);
                if (delta.new_mode && delta.old_mode && *delta.new_mode != *delta.old_mode) {
                    entry.mode = *delta.new_mode;
                }
                break;
            }
        }
    }
    return tree;
}

}  // namespace topbase_cpp
