#include <gtest/gtest.h>
#include "svgcore/validation/attribute_validation.h"

using namespace svgcore;

TEST(AttributeValidationTest, Numbers) {
    EXPECT_TRUE(validateAttribute("x", "10").valid);
    EXPECT_TRUE(validateAttribute("cy", "-2.5").valid);
    EXPECT_TRUE(validateAttribute("r", " 4 ").valid);

    const ValidationResult bad = validateAttribute("x", "abc");
    EXPECT_FALSE(bad.valid);
    EXPECT_EQ(bad.message, "Attribute \"x\" must be a valid number. Got: \"abc\"");
    EXPECT_FALSE(validateAttribute("y1", "10px").valid);
    EXPECT_FALSE(validateAttribute("x2", "").valid);
}

TEST(AttributeValidationTest, Lengths) {
    EXPECT_TRUE(validateAttribute("width", "100").valid);
    EXPECT_TRUE(validateAttribute("height", "50%").valid);
    EXPECT_TRUE(validateAttribute("stroke-width", "1.5px").valid);
    EXPECT_TRUE(validateAttribute("font-size", "2em").valid);
    EXPECT_FALSE(validateAttribute("width", "wide").valid);
    EXPECT_FALSE(validateAttribute("width", "10 px").valid);
}

TEST(AttributeValidationTest, Colors) {
    EXPECT_TRUE(validateAttribute("fill", "red").valid);
    EXPECT_TRUE(validateAttribute("fill", "CornflowerBlue").valid);
    EXPECT_TRUE(validateAttribute("stroke", "#abc").valid);
    EXPECT_TRUE(validateAttribute("stroke", "#A0B1C2").valid);
    EXPECT_TRUE(validateAttribute("fill", "none").valid);
    EXPECT_TRUE(validateAttribute("fill", "currentColor").valid);
    EXPECT_TRUE(validateAttribute("fill", "rgb(10, 20, 30)").valid);
    EXPECT_TRUE(validateAttribute("fill", "rgba(10,20,30,0.5)").valid);
    EXPECT_TRUE(validateAttribute("stop-color", "hsl(120, 50%, 50%)").valid);

    EXPECT_FALSE(validateAttribute("fill", "#abcd").valid);
    EXPECT_FALSE(validateAttribute("fill", "reddish").valid);
    EXPECT_FALSE(validateAttribute("fill", "rgb(1, 2)").valid);

    const ValidationResult range = validateAttribute("fill", "rgb(300, 0, 0)");
    EXPECT_FALSE(range.valid);
    EXPECT_EQ(range.message, "RGB values must be between 0 and 255");
}

TEST(AttributeValidationTest, Opacity) {
    EXPECT_TRUE(validateAttribute("opacity", "0").valid);
    EXPECT_TRUE(validateAttribute("fill-opacity", "0.25").valid);
    EXPECT_TRUE(validateAttribute("stroke-opacity", "1").valid);
    EXPECT_EQ(validateAttribute("opacity", "1.5").message, "Must be at most 1");
    EXPECT_EQ(validateAttribute("opacity", "-0.1").message, "Must be at least 0");
    EXPECT_FALSE(validateAttribute("opacity", "half").valid);
}

TEST(AttributeValidationTest, ViewBox) {
    EXPECT_TRUE(validateAttribute("viewBox", "0 0 800 600").valid);
    EXPECT_TRUE(validateAttribute("viewBox", "0,0,10,10").valid);
    const ValidationResult bad = validateAttribute("viewBox", "0 0 800");
    EXPECT_FALSE(bad.valid);
    EXPECT_EQ(bad.message, "Must be 4 numbers (x y w h)");
}

TEST(AttributeValidationTest, Identifiers) {
    EXPECT_TRUE(validateAttribute("id", "shape_1.a-b").valid);
    EXPECT_TRUE(validateAttribute("id", "_x").valid);
    EXPECT_FALSE(validateAttribute("id", "1abc").valid);
    EXPECT_FALSE(validateAttribute("id", "has space").valid);
    EXPECT_EQ(validateAttribute("id", "").message, "This attribute is required");
}

TEST(AttributeValidationTest, Enumerations) {
    EXPECT_TRUE(validateAttribute("fill-rule", "evenodd").valid);
    EXPECT_TRUE(validateAttribute("stroke-linecap", "round").valid);
    const ValidationResult bad = validateAttribute("text-anchor", "left");
    EXPECT_FALSE(bad.valid);
    EXPECT_EQ(bad.message, "Attribute \"text-anchor\" must be one of: start, middle, end. Got: \"left\"");
    EXPECT_TRUE(enumValuesFor("fill").empty());
}

TEST(AttributeValidationTest, UnknownAttributesAcceptAnything) {
    EXPECT_TRUE(validateAttribute("d", "M 0 0 L 10 10").valid);
    EXPECT_TRUE(validateAttribute("data-label", "").valid);
    EXPECT_TRUE(validateAttribute("transform", "rotate(45)").valid);
}

TEST(AttributeValidationTest, AttributeNames) {
    EXPECT_TRUE(isValidAttributeName("fill"));
    EXPECT_TRUE(isValidAttributeName("stroke-width"));
    EXPECT_TRUE(isValidAttributeName("xlink:href"));
    EXPECT_TRUE(isValidAttributeName("_data.x"));
    EXPECT_FALSE(isValidAttributeName(""));
    EXPECT_FALSE(isValidAttributeName("bad name"));
    EXPECT_FALSE(isValidAttributeName("1x"));
    EXPECT_FALSE(isValidAttributeName(":x"));
    EXPECT_FALSE(isValidAttributeName("a:b:c"));
    EXPECT_FALSE(isValidAttributeName("x\""));
}
