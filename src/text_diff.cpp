#include <ydoc-cpp/text_diff.hpp>

#include <ydoc-cpp/error.hpp>

#include <fmt/format.h>
#include <unicode/ubrk.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <ranges>
#include <string>
#include <utility>

namespace ydoc_cpp {

namespace {

auto checked_length(std::string_view text) -> std::int32_t {
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        throw Error{ErrorKind::invalid_operation, "text too large"};
    }
    return static_cast<std::int32_t>(text.size());
}

auto similarity(std::size_t matches, std::size_t total) -> double {
    if (total == 0) return 1.0;
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

}  // namespace

// -- Unicode helpers ----------------------------------------------------------

auto decode_utf8(std::string_view text) -> std::u32string {
    auto result = std::u32string{};
    result.reserve(text.size());
    const auto length = checked_length(text);
    auto i = std::int32_t{0};
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT_OR_FFFD(text.data(), i, length, c);
        result.push_back(static_cast<char32_t>(c));
    }
    return result;
}

auto scalar_offsets(std::string_view text) -> std::vector<std::size_t> {
    auto result = std::vector<std::size_t>{};
    result.reserve(text.size() + 1);
    const auto length = checked_length(text);
    auto i = std::int32_t{0};
    while (i < length) {
        result.push_back(static_cast<std::size_t>(i));
        U8_FWD_1(text.data(), i, length);
    }
    result.push_back(text.size());
    return result;
}

auto grapheme_boundaries(std::string_view text) -> std::vector<bool> {
    auto offsets = scalar_offsets(text);
    auto flags = std::vector<bool>(offsets.size(), false);
    flags.front() = true;
    flags.back() = true;
    if (text.empty()) return flags;

    auto status = U_ZERO_ERROR;
    auto ut = std::unique_ptr<UText, decltype(&utext_close)>{
        utext_openUTF8(nullptr, text.data(), static_cast<std::int64_t>(text.size()), &status),
        &utext_close};
    if (U_FAILURE(status)) {
        throw Error{ErrorKind::invalid_operation,
                    fmt::format("cannot open text for segmentation: {}", u_errorName(status))};
    }
    auto bi = std::unique_ptr<UBreakIterator, decltype(&ubrk_close)>{
        ubrk_open(UBRK_CHARACTER, nullptr, nullptr, 0, &status), &ubrk_close};
    if (U_FAILURE(status)) {
        throw Error{ErrorKind::invalid_operation,
                    fmt::format("cannot open grapheme iterator: {}", u_errorName(status))};
    }
    ubrk_setUText(bi.get(), ut.get(), &status);
    if (U_FAILURE(status)) {
        throw Error{ErrorKind::invalid_operation,
                    fmt::format("cannot attach text to grapheme iterator: {}",
                                u_errorName(status))};
    }

    // UTF-8 UText native indices are byte offsets
    for (auto pos = ubrk_first(bi.get()); pos != UBRK_DONE; pos = ubrk_next(bi.get())) {
        auto it = std::ranges::lower_bound(offsets, static_cast<std::size_t>(pos));
        if (it != offsets.end() && *it == static_cast<std::size_t>(pos)) {
            flags[static_cast<std::size_t>(it - offsets.begin())] = true;
        }
    }
    return flags;
}

// -- SequenceMatcher ----------------------------------------------------------

SequenceMatcher::SequenceMatcher(std::u32string a, std::u32string b, bool autojunk)
    : a_{std::move(a)}, b_{std::move(b)}, autojunk_{autojunk} {
    chain_b();
}

void SequenceMatcher::chain_b() {
    for (std::size_t j = 0; j < b_.size(); ++j) {
        b2j_[b_[j]].push_back(j);
    }
    if (!autojunk_ || b_.size() < autojunk_min_length) return;

    // Popular scalars only extend matches, never seed them
    const auto ntest = b_.size() / 100 + 1;
    std::erase_if(b2j_, [&](const auto& entry) { return entry.second.size() > ntest; });
}

auto SequenceMatcher::real_quick_ratio() const -> double {
    return similarity(std::min(a_.size(), b_.size()), a_.size() + b_.size());
}

auto SequenceMatcher::quick_ratio() const -> double {
    auto available = std::unordered_map<char32_t, std::ptrdiff_t>{};
    for (auto c : b_) ++available[c];

    auto matches = std::size_t{0};
    for (auto c : a_) {
        auto it = available.find(c);
        if (it != available.end() && it->second > 0) {
            --it->second;
            ++matches;
        }
    }
    return similarity(matches, a_.size() + b_.size());
}

auto SequenceMatcher::ratio() -> double {
    auto matches = std::size_t{0};
    for (const auto& block : matching_blocks()) matches += block.size;
    return similarity(matches, a_.size() + b_.size());
}

auto SequenceMatcher::find_longest_match(std::size_t alo, std::size_t ahi,
                                         std::size_t blo, std::size_t bhi) const -> Match {
    auto best_i = alo;
    auto best_j = blo;
    auto best_size = std::size_t{0};

    // j2len[j] = length of the longest match ending with a[i - 1] and b[j]
    auto j2len = std::unordered_map<std::size_t, std::size_t>{};
    auto new_j2len = std::unordered_map<std::size_t, std::size_t>{};
    for (auto i = alo; i < ahi; ++i) {
        new_j2len.clear();
        auto it = b2j_.find(a_[i]);
        if (it != b2j_.end()) {
            for (auto j : it->second) {
                if (j < blo) continue;
                if (j >= bhi) break;
                auto prev = std::size_t{0};
                if (j > 0) {
                    if (auto p = j2len.find(j - 1); p != j2len.end()) prev = p->second;
                }
                auto k = prev + 1;
                new_j2len[j] = k;
                if (k > best_size) {
                    best_i = i + 1 - k;
                    best_j = j + 1 - k;
                    best_size = k;
                }
            }
        }
        std::swap(j2len, new_j2len);
    }

    // Extend over scalars that were dropped from the index as popular
    while (best_i > alo && best_j > blo && a_[best_i - 1] == b_[best_j - 1]) {
        --best_i;
        --best_j;
        ++best_size;
    }
    while (best_i + best_size < ahi && best_j + best_size < bhi &&
           a_[best_i + best_size] == b_[best_j + best_size]) {
        ++best_size;
    }
    return Match{.a_pos = best_i, .b_pos = best_j, .size = best_size};
}

auto SequenceMatcher::matching_blocks() -> const std::vector<Match>& {
    while (match_step()) {}
    return matching_blocks_;
}

auto SequenceMatcher::match_step() -> bool {
    if (have_blocks_) return false;
    if (!started_) {
        pending_.push_back({0, a_.size(), 0, b_.size()});
        started_ = true;
    }
    if (pending_.empty()) {
        collapse_blocks();
        return false;
    }

    auto [alo, ahi, blo, bhi] = pending_.back();
    pending_.pop_back();
    auto m = find_longest_match(alo, ahi, blo, bhi);
    if (m.size > 0) {
        found_.push_back(m);
        if (alo < m.a_pos && blo < m.b_pos) {
            pending_.push_back({alo, m.a_pos, blo, m.b_pos});
        }
        if (m.a_pos + m.size < ahi && m.b_pos + m.size < bhi) {
            pending_.push_back({m.a_pos + m.size, ahi, m.b_pos + m.size, bhi});
        }
    }
    return true;
}

void SequenceMatcher::collapse_blocks() {
    std::ranges::sort(found_);

    auto current = Match{};
    for (const auto& block : found_) {
        if (current.a_pos + current.size == block.a_pos &&
            current.b_pos + current.size == block.b_pos) {
            current.size += block.size;
        } else {
            if (current.size > 0) matching_blocks_.push_back(current);
            current = block;
        }
    }
    if (current.size > 0) matching_blocks_.push_back(current);
    matching_blocks_.push_back(Match{.a_pos = a_.size(), .b_pos = b_.size(), .size = 0});
    found_.clear();
    have_blocks_ = true;
}

auto SequenceMatcher::opcodes() -> std::vector<Opcode> {
    auto result = std::vector<Opcode>{};
    auto i = std::size_t{0};
    auto j = std::size_t{0};
    for (const auto& block : matching_blocks()) {
        if (i < block.a_pos && j < block.b_pos) {
            result.push_back({OpTag::replace, i, block.a_pos, j, block.b_pos});
        } else if (i < block.a_pos) {
            result.push_back({OpTag::del, i, block.a_pos, j, block.b_pos});
        } else if (j < block.b_pos) {
            result.push_back({OpTag::insert, i, block.a_pos, j, block.b_pos});
        }
        i = block.a_pos + block.size;
        j = block.b_pos + block.size;
        if (block.size > 0) {
            result.push_back({OpTag::equal, block.a_pos, i, block.b_pos, j});
        }
    }
    return result;
}

}  // namespace ydoc_cpp
