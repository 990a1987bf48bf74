/**
 * @file teeth_selection.cpp
 * @brief Implementation of the teeth selection model
 */

#include <dental/core/teeth_selection.hpp>

#include <dental/core/validation.hpp>

namespace dental::core {

auto display_positions(quadrant q) -> std::array<int, teeth_per_quadrant> {
    std::array<int, teeth_per_quadrant> positions{};
    bool left_side = q == quadrant::upper_left || q == quadrant::lower_left;
    for (int i = 0; i < teeth_per_quadrant; ++i) {
        positions[i] = left_side ? teeth_per_quadrant - i : i + 1;
    }
    return positions;
}

auto make_tooth_id(quadrant q, int position) -> std::string {
    return std::string(quadrant_prefix(q)) + std::to_string(position);
}

auto is_valid_tooth_id(std::string_view token) noexcept -> bool {
    if (token.size() != 3) {
        return false;
    }
    auto prefix = token.substr(0, 2);
    bool known_prefix = false;
    for (auto q : all_quadrants) {
        if (quadrant_prefix(q) == prefix) {
            known_prefix = true;
            break;
        }
    }
    return known_prefix && token[2] >= '1' && token[2] <= '8';
}

auto parse_teeth(std::string_view serialized) -> tooth_set {
    tooth_set teeth;
    std::size_t start = 0;
    while (start <= serialized.size()) {
        auto comma = serialized.find(',', start);
        auto end = comma == std::string_view::npos ? serialized.size() : comma;

        auto token = trim(serialized.substr(start, end - start));
        if (!token.empty()) {
            teeth.insert(std::move(token));
        }

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return teeth;
}

auto toggle_tooth(tooth_set teeth, const std::string& tooth_id) -> tooth_set {
    if (teeth.erase(tooth_id) == 0) {
        teeth.insert(tooth_id);
    }
    return teeth;
}

auto serialize_teeth(const tooth_set& teeth) -> std::string {
    // std::set already iterates in lexicographic order
    std::string result;
    for (const auto& tooth : teeth) {
        if (!result.empty()) {
            result += ", ";
        }
        result += tooth;
    }
    return result;
}

// ============================================================================
// teeth_selection
// ============================================================================

teeth_selection::teeth_selection(std::string_view serialized)
    : teeth_(parse_teeth(serialized)) {}

auto teeth_selection::toggle(const std::string& tooth_id) -> bool {
    teeth_ = toggle_tooth(std::move(teeth_), tooth_id);
    return contains(tooth_id);
}

auto teeth_selection::toggle(quadrant q, int position) -> bool {
    return toggle(make_tooth_id(q, position));
}

auto teeth_selection::contains(const std::string& tooth_id) const -> bool {
    return teeth_.find(tooth_id) != teeth_.end();
}

auto teeth_selection::to_string() const -> std::string {
    return serialize_teeth(teeth_);
}

}  // namespace dental::core
