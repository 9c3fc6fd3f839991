/**
 * @file QueuePlayerTest.cpp
 * @brief Playlist playback through the mixing line and sink
 */

#include "FakeCollaborators.h"
#include "LogLevel.h"
#include "MixingLine.h"
#include "PipeSink.h"
#include "QueuePlayer.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <unistd.h>

using Reason = PlaybackEntry::EndReason;

class QueuePlayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_logLevel = LogLevel::ERROR;

        char tmpl[] = "/tmp/cuetrack_sink_XXXXXX";
        int fd = mkstemp(tmpl);
        ASSERT_GE(fd, 0);
        ::close(fd);
        sinkPath = tmpl;
    }

    void TearDown() override {
        player.reset();
        if (sink) sink->stop();
        sink.reset();
        std::remove(sinkPath.c_str());
    }

    // Adds n items of the given length to the playlist and the loader
    void addItems(int n, int lengthMs) {
        for (int i = 0; i < n; i++) {
            playlist.add("item" + std::to_string(i) + ".ogg");
            auto& item = loader.add(id(i), lengthMs);
            item.script->lengthMs = lengthMs > 0 ? lengthMs : 100;
        }
    }

    PlayableId id(int i) const {
        return PlayableId(PlayableId::Type::TRACK,
                          Playlist::idForLocation("item" + std::to_string(i) + ".ogg"));
    }

    void play() {
        sink = std::make_unique<PipeSink>(line, sinkPath);
        ASSERT_TRUE(sink->start());
        player = std::make_unique<QueuePlayer>(context, playlist, line);
        player->start();
    }

    std::vector<QueuePlayer::EndedItem> playToEnd() {
        play();
        EXPECT_TRUE(player->waitFinished(10000));
        return player->endedItems();
    }

    Config config = quietConfig();
    FakeContentLoader loader;
    PlayerContext context{loader, config, createFakeDecoder};
    Playlist playlist;
    AudioFormat format;
    MixingLine line{format};
    std::string sinkPath;
    std::unique_ptr<PipeSink> sink;
    std::unique_ptr<QueuePlayer> player;
};

TEST_F(QueuePlayerTest, PlaysItemsInOrder)
{
    addItems(3, 100);

    auto ended = playToEnd();

    ASSERT_EQ(ended.size(), 3u);
    for (size_t i = 0; i < 3; i++) {
        EXPECT_EQ(ended[i].index, i);
        EXPECT_EQ(ended[i].reason, Reason::TRACK_DONE);
        EXPECT_EQ(loader.loads(id(static_cast<int>(i))), 1);
    }
    EXPECT_GT(sink->bytesWritten(), 0u);
    EXPECT_FALSE(sink->failed());
}

TEST_F(QueuePlayerTest, FailedLoadIsRetriedOnceThenSkipped)
{
    addItems(3, 100);
    loader.add(id(1), 100).failuresLeft = 2;

    auto ended = playToEnd();

    ASSERT_EQ(ended.size(), 3u);
    EXPECT_EQ(ended[0].reason, Reason::TRACK_DONE);
    EXPECT_EQ(ended[1].index, 1u);
    EXPECT_EQ(ended[1].reason, Reason::TRACK_ERROR);
    EXPECT_EQ(ended[2].index, 2u);
    EXPECT_EQ(ended[2].reason, Reason::TRACK_DONE);
    EXPECT_EQ(loader.loads(id(1)), 2);
}

TEST_F(QueuePlayerTest, RetrySucceedsAfterOneFailure)
{
    addItems(2, 100);
    loader.add(id(0), 100).failuresLeft = 1;

    auto ended = playToEnd();

    ASSERT_EQ(ended.size(), 2u);
    EXPECT_EQ(ended[0].index, 0u);
    EXPECT_EQ(ended[0].reason, Reason::TRACK_DONE);
    EXPECT_EQ(loader.loads(id(0)), 2);
}

TEST_F(QueuePlayerTest, PlaybackErrorMovesOn)
{
    addItems(2, 100);
    loader.add(id(0), 100).script->failAtMs = 30;

    auto ended = playToEnd();

    ASSERT_EQ(ended.size(), 2u);
    EXPECT_EQ(ended[0].reason, Reason::TRACK_ERROR);
    EXPECT_EQ(ended[1].reason, Reason::TRACK_DONE);
}

TEST_F(QueuePlayerTest, SkipEndsCurrentWithForwardButton)
{
    addItems(2, 100);
    loader.add(id(0), 600000).script->lengthMs = 600000;

    play();
    player->skip();
    ASSERT_TRUE(player->waitFinished(10000));

    auto ended = player->endedItems();
    ASSERT_EQ(ended.size(), 2u);
    EXPECT_EQ(ended[0].index, 0u);
    EXPECT_EQ(ended[0].reason, Reason::FORWARD_BTN);
    EXPECT_EQ(ended[1].reason, Reason::TRACK_DONE);
}

TEST_F(QueuePlayerTest, PreloadsNextItem)
{
    config.preloadEnabled = true;
    // Unknown duration: the preload instant is due at once
    addItems(2, 0);

    auto ended = playToEnd();

    ASSERT_EQ(ended.size(), 2u);
    EXPECT_EQ(loader.loads(id(1)), 1);
    EXPECT_TRUE(loader.lastLoadWasPreload(id(1)));
    EXPECT_FALSE(loader.lastLoadWasPreload(id(0)));
}

TEST_F(QueuePlayerTest, CrossfadeStartsNextBeforeEnd)
{
    config.crossfadeDurationMs = 50;
    addItems(2, 300);

    auto ended = playToEnd();

    ASSERT_EQ(ended.size(), 2u);
    EXPECT_EQ(ended[0].index, 0u);
    EXPECT_EQ(ended[0].reason, Reason::TRACK_DONE);
    EXPECT_EQ(ended[1].index, 1u);
    EXPECT_EQ(loader.loads(id(1)), 1);
    EXPECT_TRUE(loader.lastLoadWasPreload(id(1)));
}

TEST_F(QueuePlayerTest, EmptyPlaylistFinishesAtOnce)
{
    auto ended = playToEnd();
    EXPECT_TRUE(ended.empty());
}

TEST_F(QueuePlayerTest, StopClosesPlayingItem)
{
    addItems(1, 100);
    loader.add(id(0), 600000).script->lengthMs = 600000;

    play();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    player->stop();

    EXPECT_FALSE(player->finished());
}
