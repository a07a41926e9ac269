/// @file text_diff.hpp
/// @brief Sequence matching over Unicode scalars and grapheme-cluster boundaries.
///
/// SequenceMatcher finds the longest matching blocks between two scalar
/// sequences and turns them into an edit script of opcodes. Popular scalars
/// in long inputs are ignored when seeding matches, which keeps the matcher
/// near-linear on typical text.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ydoc_cpp {

/// Inputs at least this long ignore scalars that occur in more than 1% of them.
inline constexpr std::size_t autojunk_min_length = 200;

/// The kind of edit an Opcode describes.
enum class OpTag : std::uint8_t {
    equal,    ///< a[i1:i2] == b[j1:j2]
    replace,  ///< a[i1:i2] should be replaced by b[j1:j2]
    del,      ///< a[i1:i2] should be deleted (j1 == j2)
    insert,   ///< b[j1:j2] should be inserted at a[i1] (i1 == i2)
};

/// Convert an OpTag to its string representation.
constexpr auto to_string_view(OpTag tag) noexcept -> std::string_view {
    switch (tag) {
        case OpTag::equal:   return "equal";
        case OpTag::replace: return "replace";
        case OpTag::del:     return "delete";
        case OpTag::insert:  return "insert";
    }
    return "unknown";
}

/// One step of an edit script, in scalar offsets of the old (i) and new (j)
/// sequences.
struct Opcode {
    OpTag tag{OpTag::equal};
    std::size_t i1{0};
    std::size_t i2{0};
    std::size_t j1{0};
    std::size_t j2{0};

    auto operator==(const Opcode&) const -> bool = default;
};

/// A run of `size` equal scalars at a[a_pos] and b[b_pos].
struct Match {
    std::size_t a_pos{0};
    std::size_t b_pos{0};
    std::size_t size{0};

    auto operator<=>(const Match&) const = default;
    auto operator==(const Match&) const -> bool = default;
};

/// Decode UTF-8 into Unicode scalars. Ill-formed sequences decode to U+FFFD.
auto decode_utf8(std::string_view text) -> std::u32string;

/// Byte offset of every scalar boundary in `text`: element k is where
/// scalar k starts, the last element is `text.size()`.
auto scalar_offsets(std::string_view text) -> std::vector<std::size_t>;

/// Extended grapheme-cluster boundaries of `text`, as scalar indices.
///
/// The result has one flag per scalar position (size = scalar count + 1);
/// flag k is true when a cluster starts at scalar k. Positions 0 and the end
/// are always boundaries.
auto grapheme_boundaries(std::string_view text) -> std::vector<bool>;

/// Finds matching blocks and edit scripts between two scalar sequences.
///
/// @code
/// auto m = SequenceMatcher{decode_utf8("qabxcd"), decode_utf8("abycdf")};
/// for (const auto& op : m.opcodes()) { ... }
/// @endcode
class SequenceMatcher {
public:
    /// @param a The old sequence.
    /// @param b The new sequence.
    /// @param autojunk Ignore popular scalars of `b` when it is long.
    SequenceMatcher(std::u32string a, std::u32string b, bool autojunk = true);

    /// Upper bound on ratio() from the lengths alone.
    auto real_quick_ratio() const -> double;

    /// Upper bound on ratio() from the multiset intersection of both inputs.
    auto quick_ratio() const -> double;

    /// Similarity `2*M/T`, M the matched scalars and T the total length.
    /// 1.0 when both inputs are empty.
    auto ratio() -> double;

    /// Longest matching block in a[alo:ahi] and b[blo:bhi]. Ties go to the
    /// block starting earliest in a, then earliest in b.
    auto find_longest_match(std::size_t alo, std::size_t ahi,
                            std::size_t blo, std::size_t bhi) const -> Match;

    /// Non-adjacent matching blocks in increasing order, terminated by a
    /// zero-size sentinel at (len(a), len(b)).
    auto matching_blocks() -> const std::vector<Match>&;

    /// Advance the matching-block search by one find_longest_match() call.
    ///
    /// Lets a caller spread matching_blocks() over several turns; calling
    /// matching_blocks() afterwards finishes whatever is left.
    /// @return True while ranges remain to be searched.
    auto match_step() -> bool;

    /// Edit script turning a into b.
    auto opcodes() -> std::vector<Opcode>;

    auto a() const -> const std::u32string& { return a_; }
    auto b() const -> const std::u32string& { return b_; }

private:
    struct Range {
        std::size_t alo, ahi, blo, bhi;
    };

    void chain_b();
    void collapse_blocks();

    std::u32string a_;
    std::u32string b_;
    bool autojunk_;
    std::unordered_map<char32_t, std::vector<std::size_t>> b2j_;
    std::vector<Range> pending_;
    std::vector<Match> found_;
    bool started_{false};
    std::vector<Match> matching_blocks_;
    bool have_blocks_{false};
};

}  // namespace ydoc_cpp
