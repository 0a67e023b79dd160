#include <stratum/layout/line_box.h>
#include <stratum/paint/recording_surface.h>
#include <stratum/render/element_renderer.h>
#include <stratum/style/computed_style.h>

#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace stratum::layout;
using stratum::geom::Rect;
using stratum::paint::RecordingSurface;
using stratum::paint::SurfaceCommand;
using stratum::render::ElementRenderer;
using stratum::style::ComputedStyle;
using stratum::style::Position;
using stratum::style::VerticalAlign;
using stratum::style::VerticalAlignKeyword;

// Helper: renderer whose vertical-align is the given keyword
static std::unique_ptr<ElementRenderer> make_aligned(VerticalAlignKeyword keyword) {
    ComputedStyle style;
    style.vertical_align = VerticalAlign::from_keyword(keyword);
    return std::make_unique<ElementRenderer>(style);
}

// Helper: text run with the given metrics
static std::unique_ptr<TextLineBox> make_text(ElementRenderer& owner, const std::string& text,
                                              float ascent, float descent) {
    auto box = std::make_unique<TextLineBox>(owner, text);
    box->set_leaded_ascent(ascent);
    box->set_leaded_descent(descent);
    box->set_bounds({0, 0, 10.0f * static_cast<float>(text.size()), ascent + descent});
    return box;
}

// ---------------------------------------------------------------------------
// 1. Geometry accessors
// ---------------------------------------------------------------------------
TEST(LineBox, GeometryAccessors) {
    ElementRenderer owner;
    LineBox box(owner);
    box.set_bounds({1, 2, 3, 4});
    box.set_leaded_ascent(12.5f);
    box.set_leaded_descent(3.5f);
    box.set_margin({1, 2, 3, 4});
    box.set_padding({5, 6, 7, 8});

    EXPECT_EQ(box.bounds(), (Rect{1, 2, 3, 4}));
    EXPECT_FLOAT_EQ(box.leaded_ascent(), 12.5f);
    EXPECT_FLOAT_EQ(box.leaded_descent(), 3.5f);
    EXPECT_FLOAT_EQ(box.margin().left, 4.0f);
    EXPECT_FLOAT_EQ(box.padding().top, 5.0f);
    EXPECT_EQ(&box.element_renderer(), &owner);
}

// ---------------------------------------------------------------------------
// 2. Baseline offset
// ---------------------------------------------------------------------------
TEST(LineBox, BaselineOffsetMiddle) {
    auto owner = make_aligned(VerticalAlignKeyword::Middle);
    LineBox box(*owner);
    box.set_bounds({0, 0, 40, 20});
    // 10 - (20 / 2 - 8 / 2)
    EXPECT_FLOAT_EQ(box.get_baseline_offset(10.0f, 8.0f), 4.0f);
}

TEST(LineBox, BaselineOffsetTopIsUnchanged) {
    auto owner = make_aligned(VerticalAlignKeyword::Top);
    LineBox box(*owner);
    box.set_bounds({0, 0, 40, 20});
    EXPECT_FLOAT_EQ(box.get_baseline_offset(10.0f, 8.0f), 10.0f);
}

TEST(LineBox, BaselineOffsetDefaultKeyword) {
    ElementRenderer owner;
    LineBox box(owner);
    box.set_bounds({0, 0, 40, 20});
    EXPECT_FLOAT_EQ(box.get_baseline_offset(7.0f, 8.0f), 7.0f);
}

TEST(LineBox, BaselineOffsetAddsNumericVerticalAlign) {
    ComputedStyle style;
    style.vertical_align = VerticalAlign::from_offset(-3.0f);
    ElementRenderer owner(style);
    LineBox box(owner);
    box.set_bounds({0, 0, 40, 20});
    EXPECT_FLOAT_EQ(box.get_baseline_offset(10.0f, 8.0f), 7.0f);
}

// ---------------------------------------------------------------------------
// 3. Classification
// ---------------------------------------------------------------------------
TEST(LineBox, BaseClassification) {
    ElementRenderer owner;
    LineBox box(owner);
    EXPECT_FALSE(box.is_text());
    EXPECT_FALSE(box.is_space());
    EXPECT_FALSE(box.establishes_new_formatting_context());
    EXPECT_TRUE(box.is_static_position());
    EXPECT_FALSE(box.is_absolutely_positioned());
}

TEST(LineBox, VariantClassification) {
    ElementRenderer owner;
    TextLineBox text(owner, "word");
    SpaceLineBox space(owner);
    EmbeddedLineBox embedded(owner);
    EXPECT_TRUE(text.is_text());
    EXPECT_EQ(text.text(), "word");
    EXPECT_TRUE(space.is_space());
    EXPECT_FALSE(space.is_text());
    EXPECT_TRUE(embedded.establishes_new_formatting_context());
}

TEST(LineBox, PositionQuestionsDelegateToStyle) {
    ComputedStyle style;
    style.position = Position::Fixed;
    ElementRenderer fixed_owner(style);
    LineBox fixed(fixed_owner);
    EXPECT_FALSE(fixed.is_static_position());
    EXPECT_TRUE(fixed.is_absolutely_positioned());

    style.position = Position::Relative;
    ElementRenderer relative_owner(style);
    LineBox relative(relative_owner);
    EXPECT_FALSE(relative.is_static_position());
    EXPECT_FALSE(relative.is_absolutely_positioned());
}

// ---------------------------------------------------------------------------
// 4. Tree
// ---------------------------------------------------------------------------
TEST(LineBox, AppendAndRemoveChildren) {
    ElementRenderer owner;
    RootLineBox line(owner);
    auto& first = line.append_child(std::make_unique<TextLineBox>(owner, "a"));
    auto& second = line.append_child(std::make_unique<SpaceLineBox>(owner));
    ASSERT_EQ(line.children().size(), 2u);
    EXPECT_EQ(first.parent(), &line);
    EXPECT_EQ(line.children()[1].get(), &second);

    auto removed = line.remove_child(first);
    EXPECT_EQ(removed.get(), &first);
    EXPECT_EQ(removed->parent(), nullptr);
    ASSERT_EQ(line.children().size(), 1u);
    EXPECT_EQ(line.children()[0].get(), &second);
}

// ---------------------------------------------------------------------------
// 5. Vertical alignment of a line
// ---------------------------------------------------------------------------
TEST(RootLineBox, BaselineAlignedChildrenShareBaseline) {
    ElementRenderer owner;
    RootLineBox line(owner);
    line.set_bounds({0, 100, 200, 0});
    auto& tall = line.append_child(make_text(owner, "Big", 12, 4));
    auto& small = line.append_child(make_text(owner, "small", 8, 2));

    line.align_children(6.0f);

    EXPECT_FLOAT_EQ(tall.bounds().y, 100.0f);
    EXPECT_FLOAT_EQ(small.bounds().y, 104.0f);
    EXPECT_FLOAT_EQ(line.bounds().height, 16.0f);
    EXPECT_FLOAT_EQ(line.leaded_ascent(), 12.0f);
    EXPECT_FLOAT_EQ(line.leaded_descent(), 4.0f);
}

TEST(RootLineBox, MiddleAlignedChild) {
    ElementRenderer owner;
    auto middle_owner = make_aligned(VerticalAlignKeyword::Middle);
    RootLineBox line(owner);
    line.append_child(make_text(owner, "Big", 12, 4));
    auto& middle = line.append_child(make_text(*middle_owner, "mid", 8, 2));

    line.align_children(6.0f);

    // baseline 12 - (10 / 2 - 6 / 2) = 10, top = 10 - 8
    EXPECT_FLOAT_EQ(middle.bounds().y, 2.0f);
    EXPECT_FLOAT_EQ(line.bounds().height, 16.0f);
}

TEST(RootLineBox, AbsolutelyPositionedChildIsIgnored) {
    ElementRenderer owner;
    ComputedStyle abs_style;
    abs_style.position = Position::Absolute;
    ElementRenderer abs_owner(abs_style);

    RootLineBox line(owner);
    line.append_child(make_text(owner, "Text", 10, 2));
    auto& floating = line.append_child(make_text(abs_owner, "Huge", 40, 10));
    floating.set_bounds({0, -7, 40, 50});

    line.align_children(5.0f);

    EXPECT_FLOAT_EQ(floating.bounds().y, -7.0f);
    EXPECT_FLOAT_EQ(line.bounds().height, 12.0f);
}

TEST(RootLineBox, EmptyLineHasNoHeight) {
    ElementRenderer owner;
    RootLineBox line(owner);
    line.set_bounds({0, 0, 100, 30});
    line.align_children(5.0f);
    EXPECT_FLOAT_EQ(line.bounds().height, 0.0f);
}

// ---------------------------------------------------------------------------
// 6. Rendering
// ---------------------------------------------------------------------------
TEST(LineBox, TextRendersAtBaseline) {
    ElementRenderer owner;
    RootLineBox line(owner);
    auto& text = line.append_child(make_text(owner, "hi", 12, 4));
    text.set_bounds({5, 3, 20, 16});

    RecordingSurface surface(100, 100);
    line.render(surface, {100, 200});

    ASSERT_EQ(surface.commands().size(), 1u);
    const auto& cmd = surface.commands()[0];
    EXPECT_EQ(cmd.type, SurfaceCommand::DrawText);
    EXPECT_EQ(cmd.text, "hi");
    EXPECT_FLOAT_EQ(cmd.bounds.x, 105.0f);
    EXPECT_FLOAT_EQ(cmd.bounds.y, 215.0f);
}

TEST(LineBox, SpacesAndEmbeddedBoxesPaintNothing) {
    ElementRenderer owner;
    RootLineBox line(owner);
    line.append_child(std::make_unique<SpaceLineBox>(owner));
    line.append_child(std::make_unique<EmbeddedLineBox>(owner));
    RecordingSurface surface(10, 10);
    line.render(surface, {0, 0});
    EXPECT_TRUE(surface.commands().empty());
}
