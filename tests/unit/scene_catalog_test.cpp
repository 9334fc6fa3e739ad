#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

#include "tiltbox/core/channel.hpp"
#include "tiltbox/core/engine.hpp"
#include "tiltbox/scenes/scene_catalog.hpp"

TEST(SceneCatalogTest, NamesFollowLevelOrder) {
    SceneCatalog catalog;
    auto names = catalog.getSceneNames();
    SceneLibrary library = catalog.buildLibrary();

    ASSERT_EQ(names.size(), library.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(names[i], library.at(i).name);
    }
    EXPECT_THROW(library.at(names.size()), std::out_of_range);
}

TEST(SceneCatalogTest, TiltYardDoorLeadsToBeamCavern) {
    SceneLibrary library = SceneCatalog().buildLibrary();
    auto const& yard = library.at(static_cast<std::size_t>(BuiltinLevel::TiltYard));

    ASSERT_FALSE(yard.doors.empty());
    EXPECT_EQ(yard.doors[0].destination, static_cast<std::size_t>(BuiltinLevel::BeamCavern));
    EXPECT_FALSE(yard.flagPositions.empty());
}

TEST(SceneCatalogTest, EveryBuiltinLevelLoads) {
    SceneCatalog catalog;
    for (std::size_t level = 0; level < catalog.getSceneNames().size(); ++level) {
        auto channel = Channel::bounded<Snapshot>(1);
        std::unique_ptr<PhysicsEngine> engine;
        ASSERT_NO_THROW(engine = std::make_unique<PhysicsEngine>(std::move(channel.first),
                                                                 catalog.buildLibrary(), level));
        EXPECT_EQ(engine->currentLevel(), level);
        EXPECT_TRUE(engine->registry().all_of<Components::PrimaryBall>(engine->primaryBall()));

        // a few quiet ticks must not throw or lose the ball
        for (int tick = 0; tick < 10; ++tick) {
            engine->runIteration(std::chrono::microseconds(1000));
        }
        EXPECT_FALSE(engine->entities().empty());
    }
}
