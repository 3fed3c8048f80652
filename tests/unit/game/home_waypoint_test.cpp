#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "tadv/game/home.hpp"
#include "tadv/game/waypoint.hpp"

using namespace tadv::game;
using tadv::foundation::EntityId;
using tadv::foundation::ErrorCode;

// ═══════════════════════════════════════════════════════════════════════════
// Home
// ═══════════════════════════════════════════════════════════════════════════

TEST(HomeTest, CreateValid) {
    auto home = Home::Create({700.0, 300.0}, 20.0);
    ASSERT_TRUE(home.hasValue());
    EXPECT_EQ(home.value().Position(), (Vector2{700.0, 300.0}));
    EXPECT_DOUBLE_EQ(home.value().Size(), 20.0);
}

TEST(HomeTest, RejectsNonPositiveSize) {
    for (double size : {0.0, -5.0, std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity()}) {
        auto home = Home::Create({0.0, 0.0}, size);
        ASSERT_TRUE(home.hasError());
        EXPECT_EQ(home.error().code(), ErrorCode::InvalidConfiguration);
        EXPECT_NE(home.error().context<double>(), nullptr);
    }
}

TEST(HomeTest, ContainsIncludesBoundary) {
    auto home = Home::Create({700.0, 300.0}, 20.0).value();
    EXPECT_TRUE(home.Contains(700.0, 300.0));
    EXPECT_TRUE(home.Contains(690.0, 310.0));
    EXPECT_TRUE(home.Contains(710.0, 290.0));
    EXPECT_FALSE(home.Contains(689.9, 300.0));
    EXPECT_FALSE(home.Contains(700.0, 310.1));
}

TEST(HomeTest, UpdateNeverSignalsOrMoves) {
    auto home = Home::Create({700.0, 300.0}, 20.0).value();
    TickContext context{{700.0, 300.0}, ArenaBounds{}, 1};
    EXPECT_FALSE(home.Update(context).has_value());
    EXPECT_EQ(home.Position(), (Vector2{700.0, 300.0}));
}

TEST(HomeTest, Snapshot) {
    auto home = Home::Create({700.0, 300.0}, 20.0).value();
    home.AssignId(EntityId(2));
    auto snap = home.Snapshot();
    EXPECT_EQ(snap.id, EntityId(2));
    EXPECT_EQ(snap.shape, ShapeKind::Rectangle);
    EXPECT_DOUBLE_EQ(snap.size, 20.0);
    EXPECT_EQ(snap.color, "brown");
    EXPECT_TRUE(snap.visible);
}

// ═══════════════════════════════════════════════════════════════════════════
// Waypoint
// ═══════════════════════════════════════════════════════════════════════════

TEST(WaypointTest, StartsInactive) {
    Waypoint waypoint;
    EXPECT_FALSE(waypoint.IsActive());
    EXPECT_FALSE(waypoint.Target().has_value());
}

TEST(WaypointTest, ActivateSetsTarget) {
    Waypoint waypoint;
    waypoint.Activate(120.0, 80.0);
    ASSERT_TRUE(waypoint.Target().has_value());
    EXPECT_EQ(*waypoint.Target(), (Vector2{120.0, 80.0}));
}

TEST(WaypointTest, ReactivateOverwrites) {
    Waypoint waypoint;
    waypoint.Activate(1.0, 2.0);
    waypoint.Activate(3.0, 4.0);
    EXPECT_TRUE(waypoint.IsActive());
    EXPECT_EQ(*waypoint.Target(), (Vector2{3.0, 4.0}));
}

TEST(WaypointTest, DeactivateKeepsCoordinates) {
    Waypoint waypoint;
    waypoint.Activate(10.0, 20.0);
    waypoint.Deactivate();
    EXPECT_FALSE(waypoint.IsActive());
    EXPECT_FALSE(waypoint.Target().has_value());
    EXPECT_EQ(waypoint.Position(), (Vector2{10.0, 20.0}));
}

TEST(WaypointTest, SnapshotHiddenWhileInactive) {
    Waypoint waypoint;
    auto hidden = waypoint.Snapshot();
    EXPECT_EQ(hidden.shape, ShapeKind::Cross);
    EXPECT_FALSE(hidden.visible);
    EXPECT_DOUBLE_EQ(hidden.size, 2.0 * kWaypointCrossHalfExtent);

    waypoint.Activate(5.0, 5.0);
    auto shown = waypoint.Snapshot();
    EXPECT_TRUE(shown.visible);
    EXPECT_EQ(shown.position, (Vector2{5.0, 5.0}));
}
