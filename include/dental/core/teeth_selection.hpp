/**
 * @file teeth_selection.hpp
 * @brief Teeth selection model across the four dental quadrants
 *
 * A selection is a set of tooth identifiers, each a quadrant prefix
 * (UL, UR, LL, LR) followed by a position 1..8. The serialized form is the
 * lexicographically sorted set joined by ", " and is stored verbatim as the
 * patient's teeth location.
 *
 * @example
 * @code
 * auto teeth = parse_teeth("UL8, LR3");
 * teeth = toggle_tooth(teeth, "LL1");
 * auto text = serialize_teeth(teeth);  // "LL1, LR3, UL8"
 * @endcode
 */

#pragma once

#include <array>
#include <set>
#include <string>
#include <string_view>

namespace dental::core {

/// Set of tooth identifiers such as "UL3"
using tooth_set = std::set<std::string>;

/// Number of tooth positions in each quadrant
inline constexpr int teeth_per_quadrant = 8;

/**
 * @brief Dental quadrant as seen on the selector surface
 */
enum class quadrant {
    upper_left,
    upper_right,
    lower_left,
    lower_right
};

/// All quadrants in selector layout order (upper row, then lower row)
inline constexpr std::array<quadrant, 4> all_quadrants{
    quadrant::upper_left, quadrant::upper_right,
    quadrant::lower_left, quadrant::lower_right};

/**
 * @brief Two-letter identifier prefix of a quadrant ("UL", "UR", "LL", "LR")
 */
[[nodiscard]] constexpr auto quadrant_prefix(quadrant q) noexcept
    -> std::string_view {
    switch (q) {
        case quadrant::upper_left:
            return "UL";
        case quadrant::upper_right:
            return "UR";
        case quadrant::lower_left:
            return "LL";
        case quadrant::lower_right:
            return "LR";
    }
    return "UL";
}

/**
 * @brief Human-readable quadrant name ("Upper Left", ...)
 */
[[nodiscard]] constexpr auto quadrant_label(quadrant q) noexcept
    -> std::string_view {
    switch (q) {
        case quadrant::upper_left:
            return "Upper Left";
        case quadrant::upper_right:
            return "Upper Right";
        case quadrant::lower_left:
            return "Lower Left";
        case quadrant::lower_right:
            return "Lower Right";
    }
    return "Upper Left";
}

/**
 * @brief Positions of a quadrant in visual order
 *
 * Left-side quadrants run 8 down to 1 so that the midline sits in the
 * middle of the chart; right-side quadrants run 1 up to 8. Display order
 * only, serialization is always lexicographic.
 */
[[nodiscard]] auto display_positions(quadrant q)
    -> std::array<int, teeth_per_quadrant>;

/**
 * @brief Build the identifier of a tooth ("UL" + 3 -> "UL3")
 */
[[nodiscard]] auto make_tooth_id(quadrant q, int position) -> std::string;

/**
 * @brief Check that a token has the {UL|UR|LL|LR}{1-8} shape
 *
 * parse_teeth() does not apply this check.
 */
[[nodiscard]] auto is_valid_tooth_id(std::string_view token) noexcept -> bool;

/**
 * @brief Parse a serialized selection
 *
 * Splits on ',', trims whitespace around each token and drops empty tokens.
 * Tokens are kept as opaque strings.
 */
[[nodiscard]] auto parse_teeth(std::string_view serialized) -> tooth_set;

/**
 * @brief Return a copy of @p teeth with @p tooth_id flipped
 */
[[nodiscard]] auto toggle_tooth(tooth_set teeth, const std::string& tooth_id)
    -> tooth_set;

/**
 * @brief Join the selection in lexicographic order with ", "
 */
[[nodiscard]] auto serialize_teeth(const tooth_set& teeth) -> std::string;

/**
 * @brief Working selection held by a teeth selector surface
 *
 * Starts from the field's current serialized value. The caller writes
 * to_string() back only when the user confirms; dropping the object
 * discards the edits.
 */
class teeth_selection {
public:
    teeth_selection() = default;
    explicit teeth_selection(std::string_view serialized);

    /**
     * @brief Flip one tooth
     * @return true if the tooth is selected after the call
     */
    auto toggle(const std::string& tooth_id) -> bool;

    /// Flip the tooth at @p position of quadrant @p q
    auto toggle(quadrant q, int position) -> bool;

    [[nodiscard]] auto contains(const std::string& tooth_id) const -> bool;

    [[nodiscard]] auto selected() const noexcept -> const tooth_set& {
        return teeth_;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return teeth_.empty(); }

    void clear() noexcept { teeth_.clear(); }

    /// Serialized form, identical to serialize_teeth(selected())
    [[nodiscard]] auto to_string() const -> std::string;

private:
    tooth_set teeth_;
};

}  // namespace dental::core
