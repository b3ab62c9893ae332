#include <gtest/gtest.h>
#include "test_helpers.h"
#include "fable_save.h"
#include <filesystem>
#include <fstream>

using namespace Fable;
using namespace FableTest;

namespace fs = std::filesystem;

class SaveLoadTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("fable_test_saves_" +
            std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static Environment sampleEnvironment() {
        Environment env("Test_Game");
        env.setPosition("example_1.txt", "passage");
        env.setFlag("found_key", true);
        env.setFlag("door_open", false);
        env.addScore(42);
        env.updateCounter("health", -3);
        return env;
    }
};

// 메모리 버퍼 라운드트립
TEST_F(SaveLoadTest, BufferRoundTrip) {
    Environment original = sampleEnvironment();
    auto buffer = SaveStore::serialize(original);
    ASSERT_FALSE(buffer.empty());

    Environment restored;
    ASSERT_TRUE(SaveStore::deserialize(buffer.data(), buffer.size(), restored));
    EXPECT_EQ(restored, original);
    EXPECT_EQ(restored.getIdentity(), "Test_Game");
    EXPECT_EQ(restored.getPosition().block, "passage");
    EXPECT_EQ(restored.getCounter("health"), -3);
}

// score 카운터를 지운 상태도 그대로 복원
TEST_F(SaveLoadTest, ExactCounterSetRestored) {
    Environment original("Bare");
    original.clear();
    original.updateCounter("coins", 3);

    auto buffer = SaveStore::serialize(original);
    Environment restored;
    ASSERT_TRUE(SaveStore::deserialize(buffer.data(), buffer.size(), restored));
    EXPECT_EQ(restored.getCounters().count("score"), 0u);
    EXPECT_EQ(restored, original);
}

TEST_F(SaveLoadTest, FileRoundTrip) {
    SaveStore store(dir.string());
    Environment original = sampleEnvironment();

    ASSERT_TRUE(store.save(original));
    EXPECT_TRUE(store.exists("Test_Game"));
    EXPECT_EQ(fs::path(store.pathFor("Test_Game")).filename().string(), "Test_Game.fsav");

    Environment loaded;
    ASSERT_EQ(store.load("Test_Game", loaded), SaveStore::LoadResult::OK);
    EXPECT_EQ(loaded, original);
}

TEST_F(SaveLoadTest, SaveOverwrites) {
    SaveStore store(dir.string());
    Environment env = sampleEnvironment();
    ASSERT_TRUE(store.save(env));

    env.addScore(100);
    env.setBlock("vault");
    ASSERT_TRUE(store.save(env));

    Environment loaded;
    ASSERT_EQ(store.load("Test_Game", loaded), SaveStore::LoadResult::OK);
    EXPECT_EQ(loaded.getCounter("score"), 142);
    EXPECT_EQ(loaded.getPosition().block, "vault");
}

TEST_F(SaveLoadTest, MissingSave) {
    SaveStore store(dir.string());
    Environment loaded;
    EXPECT_FALSE(store.exists("Nobody"));
    EXPECT_EQ(store.load("Nobody", loaded), SaveStore::LoadResult::NOT_FOUND);
}

TEST_F(SaveLoadTest, CorruptSaveRejected) {
    SaveStore store(dir.string());
    fs::create_directories(dir);
    {
        std::ofstream ofs(store.pathFor("Broken"), std::ios::binary);
        ofs << "this is not a flatbuffer";
    }
    Environment loaded("Keep");
    loaded.setFlag("untouched", true);
    EXPECT_EQ(store.load("Broken", loaded), SaveStore::LoadResult::INVALID);
    EXPECT_TRUE(loaded.getFlag("untouched"));
}

TEST_F(SaveLoadTest, EmptyBufferRejected) {
    Environment env;
    EXPECT_FALSE(SaveStore::deserialize(nullptr, 0, env));
}

TEST_F(SaveLoadTest, IdentityPathSeparatorsReplaced) {
    SaveStore store(dir.string());
    auto name = fs::path(store.pathFor("../evil/slot")).filename().string();
    EXPECT_EQ(name, ".._evil_slot.fsav");
    EXPECT_EQ(fs::path(store.pathFor("../evil/slot")).parent_path(), dir);
}

// Runner 상태 저장 후 재개
TEST_F(SaveLoadTest, ResumeFromSavedEnvironment) {
    const std::string script =
        ":- start\n"
        "Intro.\n"
        "+- score + 1\n"
        "*- Left -> left -> left\n"
        "*- Right -> right -> right\n"
        ":- left\n"
        "Left side.\n"
        ":- right\n"
        "Right side.\n";

    SaveStore store(dir.string());

    Runner r1;
    r1.environment().setIdentity("Slot1");
    ASSERT_TRUE(startRunner(r1, script));
    StepResult last;
    collectLines(r1, last);
    ASSERT_EQ(last.type, StepType::CHOICES);
    ASSERT_TRUE(store.save(r1.environment()));

    Environment loaded;
    ASSERT_EQ(store.load("Slot1", loaded), SaveStore::LoadResult::OK);

    Runner r2;
    r2.addDocumentSource("story.txt", script);
    ASSERT_TRUE(r2.resume(loaded));
    auto lines = collectLines(r2, last);
    EXPECT_EQ(lines, std::vector<std::string>{"Intro."});
    ASSERT_EQ(last.type, StepType::CHOICES);
    EXPECT_EQ(r2.environment().getCounter("score"), 1);

    ASSERT_TRUE(r2.choose("right"));
    EXPECT_EQ(collectLines(r2), std::vector<std::string>{"Right side."});
}
