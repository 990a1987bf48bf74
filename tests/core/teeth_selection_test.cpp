/**
 * @file teeth_selection_test.cpp
 * @brief Unit tests for the teeth selection model
 */

#include <dental/core/teeth_selection.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <string>
#include <vector>

using namespace dental::core;

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse_teeth: splits, trims and drops empty tokens",
          "[core][teeth]") {
    auto teeth = parse_teeth(" UL8 ,LR3,, LL1 ,");

    CHECK(teeth == tooth_set{"LL1", "LR3", "UL8"});
}

TEST_CASE("parse_teeth: empty input yields empty set", "[core][teeth]") {
    CHECK(parse_teeth("").empty());
    CHECK(parse_teeth(" , ,").empty());
}

TEST_CASE("parse_teeth: keeps unknown tokens as opaque strings",
          "[core][teeth]") {
    auto teeth = parse_teeth("UL9, XX1, molar");

    CHECK(teeth.size() == 3);
    CHECK(teeth.count("UL9") == 1);
    CHECK(teeth.count("molar") == 1);
}

TEST_CASE("parse_teeth: duplicate tokens collapse", "[core][teeth]") {
    CHECK(parse_teeth("UR2, UR2,UR2") == tooth_set{"UR2"});
}

// ============================================================================
// Toggle
// ============================================================================

TEST_CASE("toggle_tooth: adds an absent tooth and removes a present one",
          "[core][teeth]") {
    const tooth_set original{"LL1"};

    auto added = toggle_tooth(original, "UR4");
    CHECK(added == tooth_set{"LL1", "UR4"});

    auto removed = toggle_tooth(added, "LL1");
    CHECK(removed == tooth_set{"UR4"});

    // Input is untouched
    CHECK(original == tooth_set{"LL1"});
}

TEST_CASE("toggle_tooth: double toggle is a no-op", "[core][teeth]") {
    const std::vector<std::string> selections = {"", "LL1", "LL1, LR3, UL8",
                                                 "UL1, UL2, UR1, UR2"};
    const std::vector<std::string> tokens = {"LL1", "UL8", "LR5", "UR2"};

    for (const auto& s : selections) {
        for (const auto& t : tokens) {
            INFO("selection: '" << s << "' token: " << t);
            auto once = serialize_teeth(parse_teeth(s));
            auto twice = serialize_teeth(toggle_tooth(toggle_tooth(parse_teeth(s), t), t));
            CHECK(twice == once);
        }
    }
}

// ============================================================================
// Serialization
// ============================================================================

TEST_CASE("serialize_teeth: lexicographic order joined by comma-space",
          "[core][teeth]") {
    CHECK(serialize_teeth({"LR3", "UL8", "LL1"}) == "LL1, LR3, UL8");
    CHECK(serialize_teeth({}) == "");
    CHECK(serialize_teeth({"UR1"}) == "UR1");
}

TEST_CASE("serialize_teeth: parse of serialized output is stable",
          "[core][teeth]") {
    auto canonical = serialize_teeth(parse_teeth("UR7,LL2 ,UL1"));

    CHECK(canonical == "LL2, UL1, UR7");
    CHECK(serialize_teeth(parse_teeth(canonical)) == canonical);
}

// ============================================================================
// Quadrant Layout
// ============================================================================

TEST_CASE("display_positions: left quadrants descend, right quadrants ascend",
          "[core][teeth]") {
    const std::array<int, 8> descending{8, 7, 6, 5, 4, 3, 2, 1};
    const std::array<int, 8> ascending{1, 2, 3, 4, 5, 6, 7, 8};

    CHECK(display_positions(quadrant::upper_left) == descending);
    CHECK(display_positions(quadrant::lower_left) == descending);
    CHECK(display_positions(quadrant::upper_right) == ascending);
    CHECK(display_positions(quadrant::lower_right) == ascending);
}

TEST_CASE("make_tooth_id: prefixes the quadrant", "[core][teeth]") {
    CHECK(make_tooth_id(quadrant::upper_left, 3) == "UL3");
    CHECK(make_tooth_id(quadrant::upper_right, 1) == "UR1");
    CHECK(make_tooth_id(quadrant::lower_left, 8) == "LL8");
    CHECK(make_tooth_id(quadrant::lower_right, 5) == "LR5");
}

TEST_CASE("is_valid_tooth_id: checks prefix and position", "[core][teeth]") {
    CHECK(is_valid_tooth_id("UL1"));
    CHECK(is_valid_tooth_id("LR8"));
    CHECK_FALSE(is_valid_tooth_id("UL0"));
    CHECK_FALSE(is_valid_tooth_id("UL9"));
    CHECK_FALSE(is_valid_tooth_id("ul1"));
    CHECK_FALSE(is_valid_tooth_id("XX1"));
    CHECK_FALSE(is_valid_tooth_id("UL12"));
    CHECK_FALSE(is_valid_tooth_id(""));
}

// ============================================================================
// teeth_selection
// ============================================================================

TEST_CASE("teeth_selection: starts from the serialized value",
          "[core][teeth]") {
    teeth_selection selection("UR2, LL1");

    CHECK(selection.contains("UR2"));
    CHECK(selection.contains("LL1"));
    CHECK_FALSE(selection.contains("UL1"));
    CHECK(selection.to_string() == "LL1, UR2");
}

TEST_CASE("teeth_selection: toggle reports the new state", "[core][teeth]") {
    teeth_selection selection;

    CHECK(selection.toggle(quadrant::upper_left, 6));
    CHECK(selection.contains("UL6"));
    CHECK_FALSE(selection.toggle("UL6"));
    CHECK(selection.empty());
}

TEST_CASE("teeth_selection: clear drops every tooth", "[core][teeth]") {
    teeth_selection selection("UL1, UL2, LR7");

    selection.clear();

    CHECK(selection.empty());
    CHECK(selection.to_string().empty());
}

TEST_CASE("teeth_selection: output matches serialize_teeth",
          "[core][teeth]") {
    teeth_selection selection;
    selection.toggle("UL8");
    selection.toggle("LR3");
    selection.toggle("LL1");

    CHECK(selection.to_string() == "LL1, LR3, UL8");
    CHECK(selection.to_string() == serialize_teeth(selection.selected()));
}
