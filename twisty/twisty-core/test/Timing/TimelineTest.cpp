// Ticket: 0004_move_scheduling

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "twisty-core/src/Timing/Timeline.hpp"

using namespace twisty_core;
using std::chrono::milliseconds;

TEST(TimelineTest, After_RunsOnlyOnceDue)
{
  Timeline timeline;
  int calls = 0;
  timeline.after(milliseconds{100}, [&calls]() { ++calls; });

  timeline.update(milliseconds{99});
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(timeline.pendingCount(), 1u);

  timeline.update(milliseconds{100});
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(timeline.isIdle());

  timeline.update(milliseconds{500});
  EXPECT_EQ(calls, 1);
}

TEST(TimelineTest, DueActions_RunInDueThenInsertionOrder)
{
  Timeline timeline;
  std::string order;
  timeline.after(milliseconds{20}, [&order]() { order += 'c'; });
  timeline.after(milliseconds{10}, [&order]() { order += 'a'; });
  timeline.after(milliseconds{10}, [&order]() { order += 'b'; });

  timeline.update(milliseconds{50});

  EXPECT_EQ(order, "abc");
}

TEST(TimelineTest, Callbacks_SeeTheirDueTime)
{
  Timeline timeline;
  std::vector<milliseconds> seen;
  timeline.after(milliseconds{30},
                 [&]() { seen.push_back(timeline.now()); });

  timeline.update(milliseconds{1000});

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen.front(), milliseconds{30});
  EXPECT_EQ(timeline.now(), milliseconds{1000});
}

TEST(TimelineTest, ChainedActions_RunWithinOneUpdate)
{
  Timeline timeline;
  std::vector<milliseconds> seen;

  std::function<void()> tick = [&]()
  {
    seen.push_back(timeline.now());
    if (seen.size() < 4)
    {
      timeline.after(milliseconds{150}, tick);
    }
  };
  timeline.after(milliseconds{1000}, tick);

  timeline.update(milliseconds{10000});

  ASSERT_EQ(seen.size(), 4u);
  EXPECT_EQ(seen[0], milliseconds{1000});
  EXPECT_EQ(seen[3], milliseconds{1450});
  EXPECT_TRUE(timeline.isIdle());
}

TEST(TimelineTest, Animate_StepsThenCompletes)
{
  Timeline timeline;
  std::vector<double> progress;
  bool done = false;

  timeline.animate(
    milliseconds{280},
    [&progress](double p) { progress.push_back(p); },
    [&done]() { done = true; });

  timeline.update(milliseconds{70});
  timeline.update(milliseconds{140});
  EXPECT_FALSE(done);

  timeline.update(milliseconds{280});
  EXPECT_TRUE(done);

  ASSERT_EQ(progress.size(), 3u);
  EXPECT_DOUBLE_EQ(progress[0], 0.25);
  EXPECT_DOUBLE_EQ(progress[1], 0.5);
  EXPECT_DOUBLE_EQ(progress[2], 1.0);
}

TEST(TimelineTest, Animate_FinalStepPrecedesCompletion)
{
  Timeline timeline;
  std::string order;

  timeline.animate(
    milliseconds{100},
    [&order](double p) { order += p == 1.0 ? 'S' : 's'; },
    [&order]() { order += 'C'; });

  timeline.update(milliseconds{5000});

  EXPECT_EQ(order, "SC");
}

TEST(TimelineTest, NegativeDuration_Throws)
{
  Timeline timeline;
  EXPECT_THROW(timeline.animate(milliseconds{-1}, nullptr, nullptr),
               std::invalid_argument);
}

TEST(TimelineTest, EarlierTime_IsIgnored)
{
  Timeline timeline;
  int calls = 0;
  timeline.update(milliseconds{500});
  timeline.after(milliseconds{100}, [&calls]() { ++calls; });

  timeline.update(milliseconds{200});
  EXPECT_EQ(timeline.now(), milliseconds{500});
  EXPECT_EQ(calls, 0);

  timeline.update(milliseconds{600});
  EXPECT_EQ(calls, 1);
}
