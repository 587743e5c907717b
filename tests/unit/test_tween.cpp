#include <gtest/gtest.h>
#include <tweenkit/tween.hpp>

#include "util/tween_fixture.hpp"

using namespace tweenkit;
using tweenkit::test::TweenFixture;

class TweenTest : public TweenFixture
{
   protected:
    // x: 0 -> 100 over one second, ticking every 250 ms
    std::shared_ptr<Tween> start_x_tween(int fps = 4)
    {
        engine_->set_fps(fps);
        TweenConfig config;
        config.from     = PropertyMap{{"x", 0.0}};
        config.to       = PropertyMap{{"x", 100.0}};
        config.duration = 1000.0;
        config.step     = [this](PropertyMap&) { ++steps_; };
        config.callback = [this](PropertyMap& current)
        {
            ++completions_;
            completed_with_ = current;
        };
        return engine_->tween(config);
    }

    int         steps_       = 0;
    int         completions_ = 0;
    PropertyMap completed_with_;
};

// ─── Interpolation ──────────────────────────────────────────────────────────

TEST_F(TweenTest, LinearInterpolationIsExact)
{
    auto tween = start_x_tween();
    ASSERT_NE(tween, nullptr);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 0.0);

    advance_to(250.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 25.0);
    advance_to(500.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 50.0);
    advance_to(750.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 75.0);
    advance_to(1000.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 100.0);
}

TEST_F(TweenTest, OnlySharedPropertiesAnimate)
{
    engine_->set_fps(4);
    auto tween = engine_->tween({{"x", 0.0}, {"y", 5.0}}, {{"x", 10.0}}, 1000.0);
    ASSERT_NE(tween, nullptr);

    advance_to(500.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 5.0);
    EXPECT_DOUBLE_EQ(tween->get().at("y"), 5.0);

    advance_to(1000.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 10.0);
    EXPECT_DOUBLE_EQ(tween->get().at("y"), 5.0);
}

TEST_F(TweenTest, TargetOnlyPropertiesAreNotCreatedWhileAnimating)
{
    engine_->set_fps(4);
    auto tween = engine_->tween({{"x", 0.0}}, {{"x", 10.0}, {"z", 3.0}}, 1000.0);
    ASSERT_NE(tween, nullptr);

    advance_to(750.0);
    EXPECT_EQ(tween->get().count("z"), 0u);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 7.5);
}

TEST_F(TweenTest, StepCallbackRunsOncePerTick)
{
    start_x_tween();
    advance_to(250.0);
    EXPECT_EQ(steps_, 1);
    advance_to(750.0);
    EXPECT_EQ(steps_, 3);

    // The final tick completes instead of stepping
    advance_to(1000.0);
    EXPECT_EQ(steps_, 3);
}

TEST_F(TweenTest, GetReturnsLiveView)
{
    auto               tween = start_x_tween();
    const PropertyMap* view  = &tween->get();

    advance_to(500.0);
    EXPECT_EQ(&tween->get(), view);
    EXPECT_DOUBLE_EQ(view->at("x"), 50.0);

    advance_to(1000.0);
    EXPECT_EQ(&tween->get(), view);
    EXPECT_DOUBLE_EQ(view->at("x"), 100.0);
}

// ─── Completion ─────────────────────────────────────────────────────────────

TEST_F(TweenTest, NaturalCompletionSnapsAndCallsBackOnce)
{
    auto tween = start_x_tween();
    advance_to(5000.0);

    EXPECT_EQ(completions_, 1);
    EXPECT_DOUBLE_EQ(completed_with_.at("x"), 100.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 100.0);
    EXPECT_EQ(tween->state(), TweenState::Finished);
    EXPECT_EQ(clock_.pending(), 0u);
}

TEST_F(TweenTest, StopWithGotoEndCompletesImmediately)
{
    auto tween = start_x_tween();
    advance_to(250.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 25.0);

    tween->stop(true);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 100.0);
    EXPECT_EQ(completions_, 1);
    EXPECT_EQ(clock_.pending(), 0u);

    advance_to(2000.0);
    tween->stop(true);
    EXPECT_EQ(completions_, 1);
    EXPECT_EQ(steps_, 1);
}

TEST_F(TweenTest, StopWithoutGotoEndFreezesCurrent)
{
    auto tween = start_x_tween();
    advance_to(500.0);

    tween->stop();
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 50.0);
    EXPECT_EQ(tween->state(), TweenState::Stopped);

    advance_to(3000.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 50.0);
    EXPECT_EQ(completions_, 0);
    EXPECT_EQ(clock_.pending(), 0u);
}

TEST_F(TweenTest, StopFalseIsSameAsStop)
{
    auto tween = start_x_tween();
    advance_to(250.0);
    tween->stop(false);
    advance_to(3000.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 25.0);
    EXPECT_EQ(completions_, 0);
}

TEST_F(TweenTest, StopWithGotoEndAfterStopDoesNotComplete)
{
    auto tween = start_x_tween();
    advance_to(500.0);
    tween->stop(false);

    auto next = engine_->tween({{"y", 0.0}}, {{"y", 1.0}}, 1000.0);
    ASSERT_NE(next, nullptr);

    tween->stop(true);
    EXPECT_EQ(completions_, 0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 50.0);
    EXPECT_EQ(tween->state(), TweenState::Stopped);
    EXPECT_TRUE(next->is_animating());
}

TEST_F(TweenTest, StoppedTweenIgnoresPauseAndResume)
{
    auto tween = start_x_tween();
    advance_to(250.0);
    tween->stop();
    tween->pause().resume();
    EXPECT_EQ(clock_.pending(), 0u);
    EXPECT_EQ(tween->state(), TweenState::Stopped);
}

// ─── Pause / resume ─────────────────────────────────────────────────────────

TEST_F(TweenTest, PauseHoldsCurrentValue)
{
    auto tween = start_x_tween(10);
    advance_to(200.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 20.0);

    tween->pause();
    EXPECT_TRUE(tween->is_paused());
    EXPECT_EQ(tween->state(), TweenState::Paused);
    EXPECT_EQ(clock_.pending(), 0u);

    advance_to(5000.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 20.0);
    EXPECT_EQ(completions_, 0);
    EXPECT_TRUE(engine_->is_animating());
}

TEST_F(TweenTest, ResumeExcludesPausedTime)
{
    auto tween = start_x_tween(10);
    advance_to(200.0);
    tween->pause();

    advance_to(700.0);
    tween->resume();
    EXPECT_FALSE(tween->is_paused());
    EXPECT_DOUBLE_EQ(tween->parameters().timestamp, 500.0);

    advance_to(800.0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 30.0);

    advance_to(1499.0);
    EXPECT_EQ(completions_, 0);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 90.0);

    advance_to(1500.0);
    EXPECT_EQ(completions_, 1);
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 100.0);
}

TEST_F(TweenTest, RepeatedPausesAccumulate)
{
    auto tween = start_x_tween(10);
    advance_to(100.0);
    tween->pause();
    advance_to(300.0);
    tween->resume();

    advance_to(400.0);
    tween->pause();
    advance_to(700.0);
    tween->resume();

    // 500 ms spent paused in total
    EXPECT_DOUBLE_EQ(tween->parameters().timestamp, 500.0);
    EXPECT_DOUBLE_EQ(tween->elapsed(), 200.0);

    advance_to(1499.0);
    EXPECT_EQ(completions_, 0);
    advance_to(1500.0);
    EXPECT_EQ(completions_, 1);
}

TEST_F(TweenTest, ResumeReschedulesAtEngineFrameRate)
{
    auto tween = start_x_tween(10);
    advance_to(200.0);
    tween->pause();
    advance_to(700.0);
    tween->resume();

    clock_.advance(99.0);
    EXPECT_EQ(steps_, 2);
    clock_.advance(1.0);
    EXPECT_EQ(steps_, 3);
}

TEST_F(TweenTest, ResumeWithoutPauseDoesNotDoubleTick)
{
    auto tween = start_x_tween(10);
    tween->resume();
    EXPECT_EQ(clock_.pending(), 1u);

    advance_to(100.0);
    EXPECT_EQ(steps_, 1);
}

TEST_F(TweenTest, PauseTwiceKeepsFirstPauseTime)
{
    auto tween = start_x_tween(10);
    advance_to(200.0);
    tween->pause();
    advance_to(400.0);
    tween->pause();
    advance_to(700.0);
    tween->resume();

    EXPECT_DOUBLE_EQ(tween->parameters().timestamp, 500.0);
}

TEST_F(TweenTest, StepCallbackMayPauseTheRun)
{
    engine_->set_fps(10);
    std::shared_ptr<Tween> tween;
    TweenConfig            config;
    config.from     = PropertyMap{{"x", 0.0}};
    config.to       = PropertyMap{{"x", 100.0}};
    config.duration = 1000.0;
    config.step     = [&](PropertyMap& current)
    {
        if (current.at("x") >= 30.0)
            tween->pause();
    };
    tween = engine_->tween(config);

    advance_to(1000.0);
    EXPECT_TRUE(tween->is_paused());
    EXPECT_DOUBLE_EQ(tween->get().at("x"), 30.0);
    EXPECT_EQ(clock_.pending(), 0u);
}

// ─── Queries ────────────────────────────────────────────────────────────────

TEST_F(TweenTest, StateNames)
{
    EXPECT_STREQ(tween_state_name(TweenState::Animating), "animating");
    EXPECT_STREQ(tween_state_name(TweenState::Paused), "paused");
    EXPECT_STREQ(tween_state_name(TweenState::Stopped), "stopped");
    EXPECT_STREQ(tween_state_name(TweenState::Finished), "finished");
}

TEST_F(TweenTest, ElapsedTracksAnimatedTime)
{
    auto tween = start_x_tween(10);
    EXPECT_DOUBLE_EQ(tween->elapsed(), 0.0);
    advance_to(300.0);
    EXPECT_DOUBLE_EQ(tween->elapsed(), 300.0);
    tween->pause();
    advance_to(900.0);
    EXPECT_DOUBLE_EQ(tween->elapsed(), 300.0);
    advance_to(5000.0);
    tween->resume();
    advance_to(20000.0);
    EXPECT_DOUBLE_EQ(tween->elapsed(), 1000.0);
}

TEST_F(TweenTest, OriginalStateIsASnapshot)
{
    auto tween = start_x_tween();
    advance_to(750.0);
    EXPECT_DOUBLE_EQ(tween->parameters().original_state.at("x"), 0.0);
    EXPECT_DOUBLE_EQ(tween->parameters().to.at("x"), 100.0);
}
