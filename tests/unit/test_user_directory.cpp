#include <gtest/gtest.h>
#include "session/user_directory.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using namespace vani;
using namespace vani::session;
using json = nlohmann::json;

class JsonFileUserDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("", Logger::Level::Critical, false);
        path_ = std::filesystem::temp_directory_path() /
                ("vani_users_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        write(R"({
            "users": [
                {
                    "token": "tok-free",
                    "user_id": "u1",
                    "is_premium": false,
                    "session_time": 120,
                    "provider": "openai",
                    "voice": "alloy",
                    "pitch_factor": 1.2,
                    "first_message": "Hi!",
                    "device": {"device_id": "esp-01", "volume": 55, "selected_bhajan_id": 7}
                },
                {
                    "token": "tok-nodevice",
                    "user_id": "u2",
                    "is_premium": true,
                    "provider": "hume"
                }
            ]
        })");
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        Logger::shutdown();
    }

    void write(const std::string& content) {
        std::ofstream file(path_);
        file << content;
    }

    json readBack() const {
        std::ifstream file(path_);
        return json::parse(file);
    }

    std::filesystem::path path_;
};

TEST_F(JsonFileUserDirectoryTest, ResolvesUserByToken) {
    JsonFileUserDirectory directory(path_.string());
    directory.load();
    EXPECT_EQ(directory.userCount(), 2u);

    auto user = directory.resolveUser("tok-free");
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->userId, "u1");
    EXPECT_FALSE(user->isPremium);
    EXPECT_EQ(user->cumulativeUsageSeconds, 120u);
    EXPECT_EQ(user->providerTag, "openai");
    EXPECT_DOUBLE_EQ(user->pitchFactor, 1.2);
    EXPECT_EQ(user->firstMessage, "Hi!");
    ASSERT_TRUE(user->device.has_value());
    EXPECT_EQ(user->device->deviceId, "esp-01");
    EXPECT_EQ(user->device->volume, 55);
    EXPECT_EQ(user->device->selectedAssetId, std::optional<std::string>("7"));

    auto premium = directory.resolveUser("tok-nodevice");
    ASSERT_TRUE(premium.has_value());
    EXPECT_TRUE(premium->isPremium);
    EXPECT_FALSE(premium->device.has_value());

    EXPECT_FALSE(directory.resolveUser("tok-unknown").has_value());
    EXPECT_FALSE(directory.resolveUser("").has_value());
}

TEST_F(JsonFileUserDirectoryTest, MutationsAreWrittenBack) {
    JsonFileUserDirectory directory(path_.string());
    directory.load();

    EXPECT_TRUE(directory.persistUsageSeconds("u1", 480));
    EXPECT_TRUE(directory.recordPlaybackStatus("u1", "playing", std::string("42")));
    EXPECT_TRUE(directory.recordConversation("u1", "assistant", "Jai Shri Krishna"));
    EXPECT_FALSE(directory.persistUsageSeconds("nobody", 1));

    auto document = readBack();
    const auto& user = document["users"][0];
    EXPECT_EQ(user["session_time"], 480);
    EXPECT_EQ(user["device"]["current_bhajan_status"], "playing");
    EXPECT_EQ(user["device"]["selected_bhajan_id"], "42");
    ASSERT_EQ(user["conversations"].size(), 1u);
    EXPECT_EQ(user["conversations"][0]["role"], "assistant");
    EXPECT_EQ(user["conversations"][0]["content"], "Jai Shri Krishna");

    JsonFileUserDirectory reloaded(path_.string());
    reloaded.load();
    EXPECT_EQ(reloaded.resolveUser("tok-free")->cumulativeUsageSeconds, 480u);
}

TEST_F(JsonFileUserDirectoryTest, ConversationHistoryKeepsNewestEntries) {
    JsonFileUserDirectory directory(path_.string(), 3);
    directory.load();

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(directory.recordConversation("u1", i % 2 == 0 ? "user" : "assistant", "line " + std::to_string(i)));
    }

    auto document = readBack();
    const auto& conversations = document["users"][0]["conversations"];
    ASSERT_EQ(conversations.size(), 3u);
    EXPECT_EQ(conversations[0]["content"], "line 2");
    EXPECT_EQ(conversations[2]["content"], "line 4");
    EXPECT_EQ(conversations[2]["role"], "user");
}

TEST_F(JsonFileUserDirectoryTest, MissingOrMalformedFileThrows) {
    JsonFileUserDirectory missing((path_.string() + ".absent"));
    EXPECT_THROW(missing.load(), BridgeError);

    write("{\"users\": 3}");
    JsonFileUserDirectory malformed(path_.string());
    try {
        malformed.load();
        FAIL() << "users must be an array";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfiguration);
    }
}
