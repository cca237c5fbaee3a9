#include "gtest/gtest.h"
#include <graph/render/camera_utils.h>
#include <gui/views/graph_types.h> // For GraphViewState

using wsm::GraphViewState;
using wsm::graph::CameraUtils;

TEST(CameraUtilsTest, PanAndZoomInvariants) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(0, 0);
    view_state.zoom_scale = 1.0f;

    ImVec2 world_point(100, 200);

    // Initial state
    ImVec2 screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    ImVec2 world_point_rt = CameraUtils::ScreenToWorld(screen_point, ImVec2(0, 0), view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    // Zoom
    view_state.zoom_scale = 2.0f;
    screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    world_point_rt = CameraUtils::ScreenToWorld(screen_point, ImVec2(0, 0), view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    // Pan
    view_state.pan_offset = ImVec2(30, -40);
    screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    world_point_rt = CameraUtils::ScreenToWorld(screen_point, ImVec2(0, 0), view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);
}

TEST(CameraUtilsTest, ScreenToWorldHonorsCanvasOrigin) {
    GraphViewState view_state;
    ImVec2 canvas_pos(50, 60);
    ImVec2 world = CameraUtils::ScreenToWorld(ImVec2(150, 160), canvas_pos, view_state);
    EXPECT_NEAR(world.x, 100.0f, 1e-3);
    EXPECT_NEAR(world.y, 100.0f, 1e-3);
}

TEST(CameraUtilsTest, ZoomAtKeepsPivotFixed) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(12, -7);
    ImVec2 pivot(200, 150);
    ImVec2 world_under_pivot = CameraUtils::ScreenToWorld(pivot, ImVec2(0, 0), view_state);

    CameraUtils::ZoomAt(view_state, pivot, 1.15f);
    EXPECT_NEAR(view_state.zoom_scale, 1.15f, 1e-5);

    ImVec2 screen = CameraUtils::WorldToScreen(world_under_pivot, view_state);
    EXPECT_NEAR(screen.x, pivot.x, 1e-2);
    EXPECT_NEAR(screen.y, pivot.y, 1e-2);
}

TEST(CameraUtilsTest, ZoomIsClamped) {
    GraphViewState view_state;
    for (int i = 0; i < 100; ++i) CameraUtils::ZoomAt(view_state, ImVec2(0, 0), 2.0f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, CameraUtils::kMaxZoom);
    for (int i = 0; i < 100; ++i) CameraUtils::ZoomAt(view_state, ImVec2(0, 0), 0.5f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, CameraUtils::kMinZoom);
}

TEST(CameraUtilsTest, FitToBoundsCentersContent) {
    GraphViewState view_state;
    ImVec2 canvas(800, 600);
    CameraUtils::FitToBounds(view_state, ImVec2(0, 0), ImVec2(200, 100), canvas);

    // Small content is not magnified.
    EXPECT_FLOAT_EQ(view_state.zoom_scale, 1.0f);
    ImVec2 center = CameraUtils::WorldToScreen(ImVec2(100, 50), view_state);
    EXPECT_NEAR(center.x, 400.0f, 1e-3);
    EXPECT_NEAR(center.y, 300.0f, 1e-3);

    // Large content shrinks to fit inside the margins.
    CameraUtils::FitToBounds(view_state, ImVec2(0, 0), ImVec2(2000, 500), canvas, 40.0f);
    EXPECT_LT(view_state.zoom_scale, 1.0f);
    ImVec2 right = CameraUtils::WorldToScreen(ImVec2(2000, 250), view_state);
    EXPECT_LE(right.x, 800.0f - 40.0f + 1e-3);
}
