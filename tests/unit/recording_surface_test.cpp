#include <stratum/paint/recording_surface.h>

#include <gtest/gtest.h>
#include <memory>

using namespace stratum::paint;

TEST(RecordingSurface, RecordsCommandsInOrder) {
    RecordingSurface surface(100, 50);
    surface.clear();
    surface.begin_transparency(0.5f);
    surface.fill_rect({0, 0, 10, 10}, {255, 0, 0, 255});
    surface.end_transparency();

    const auto& cmds = surface.commands();
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0].type, SurfaceCommand::Clear);
    EXPECT_EQ(cmds[1].type, SurfaceCommand::BeginTransparency);
    EXPECT_FLOAT_EQ(cmds[1].opacity, 0.5f);
    EXPECT_EQ(cmds[2].type, SurfaceCommand::FillRect);
    EXPECT_EQ(cmds[2].bounds, (stratum::geom::Rect{0, 0, 10, 10}));
    EXPECT_EQ(cmds[3].type, SurfaceCommand::EndTransparency);
    EXPECT_EQ(surface.transparency_depth(), 0);
}

TEST(RecordingSurface, ResizeUpdatesDimensions) {
    RecordingSurface surface(100, 50);
    surface.resize(640, 480);
    EXPECT_EQ(surface.width(), 640);
    EXPECT_EQ(surface.height(), 480);
    EXPECT_EQ(surface.count(SurfaceCommand::Resize), 1u);
}

TEST(RecordingSurface, ChildSurfacesKeepRegistrationOrder) {
    RecordingSurface parent(10, 10);
    RecordingSurface first(10, 10);
    RecordingSurface second(10, 10);
    parent.append_child_surface(first);
    parent.append_child_surface(second);
    ASSERT_EQ(parent.child_surfaces().size(), 2u);
    EXPECT_EQ(parent.child_surfaces()[0], &first);
    EXPECT_EQ(parent.child_surfaces()[1], &second);

    parent.remove_child_surface(first);
    ASSERT_EQ(parent.child_surfaces().size(), 1u);
    EXPECT_EQ(parent.child_surfaces()[0], &second);
}

TEST(RecordingSurface, DisposeMarksSurface) {
    RecordingSurface surface(10, 10);
    EXPECT_FALSE(surface.disposed());
    surface.dispose();
    EXPECT_TRUE(surface.disposed());
    EXPECT_EQ(surface.commands().back().type, SurfaceCommand::Dispose);
}

TEST(RecordingSurface, DrawTextRecordsOrigin) {
    RecordingSurface surface(10, 10);
    surface.draw_text("hello", 3, 14, 16, {0, 0, 0, 255});
    ASSERT_EQ(surface.commands().size(), 1u);
    const auto& cmd = surface.commands()[0];
    EXPECT_EQ(cmd.text, "hello");
    EXPECT_FLOAT_EQ(cmd.bounds.x, 3.0f);
    EXPECT_FLOAT_EQ(cmd.bounds.y, 14.0f);
    EXPECT_FLOAT_EQ(cmd.font_size, 16.0f);
}

TEST(RecordingSurfaceFactory, CountsCreatedSurfaces) {
    RecordingSurfaceFactory factory;
    auto a = factory.create(20, 30);
    auto b = factory.create(40, 50);
    EXPECT_EQ(factory.created_count(), 2u);
    EXPECT_EQ(factory.created()[0], a.get());
    EXPECT_EQ(a->width(), 20);
    EXPECT_EQ(b->height(), 50);
}

#ifndef NDEBUG
TEST(RecordingSurfaceDeathTest, RemovingUnknownChildAsserts) {
    RecordingSurface parent(10, 10);
    RecordingSurface stranger(10, 10);
    EXPECT_DEATH(parent.remove_child_surface(stranger), "not a child");
}
#endif
