#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "kiosk/exception.hpp"
#include "kiosk/scheduler.hpp"

using namespace kiosk;

namespace {

enum class Behavior { HEALTHY, DOWN, BUGGY };

class CountingSource : public SourceManager {
public:
	CountingSource(std::string key, std::shared_ptr<ResultCache> cache, Behavior behavior, bool enabled = true)
	    : SourceManager(std::move(key), std::move(cache), std::chrono::seconds(60)), behavior_(behavior),
	      enabled_(enabled) {
	}

	bool IsEnabled() const override {
		return enabled_;
	}

	std::atomic<int> fetches {0};

protected:
	FetchOutcome FetchData() override {
		fetches++;
		switch (behavior_) {
		case Behavior::DOWN:
			throw NetworkException("upstream down");
		case Behavior::BUGGY:
			throw std::runtime_error("unexpected state");
		default:
			break;
		}
		PayloadBuilder builder;
		builder.AddInt("v", 1);
		return FetchOutcome::Success(builder.Build());
	}

private:
	Behavior behavior_;
	bool enabled_;
};

class ToggleBugSource : public CountingSource {
public:
	ToggleBugSource(std::string key, std::shared_ptr<ResultCache> cache)
	    : CountingSource(std::move(key), std::move(cache), Behavior::HEALTHY) {
	}

	bool IsEnabled() const override {
		throw std::logic_error("enabled flag unreadable");
	}
};

//! Blocks inside every fetch for a fixed time
class SlowSource : public SourceManager {
public:
	SlowSource(std::string key, std::shared_ptr<ResultCache> cache, std::chrono::milliseconds delay)
	    : SourceManager(std::move(key), std::move(cache), std::chrono::seconds(60)), delay_(delay) {
	}

	std::atomic<int> fetches {0};
	std::atomic<int> completed {0};

protected:
	FetchOutcome FetchData() override {
		fetches++;
		std::this_thread::sleep_for(delay_);
		completed++;
		PayloadBuilder builder;
		builder.AddInt("v", 1);
		return FetchOutcome::Success(builder.Build());
	}

private:
	std::chrono::milliseconds delay_;
};

SchedulerSettings FastSettings() {
	SchedulerSettings settings;
	settings.update_interval = std::chrono::milliseconds(50);
	settings.check_interval = std::chrono::milliseconds(10);
	settings.error_backoff = std::chrono::milliseconds(10);
	return settings;
}

template <class PREDICATE>
bool WaitFor(PREDICATE predicate, std::chrono::milliseconds timeout) {
	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		if (predicate()) {
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	return predicate();
}

} // namespace

class RefreshSchedulerTest : public ::testing::Test {
protected:
	RefreshSchedulerTest() : cache(std::make_shared<ResultCache>()) {
	}

	std::shared_ptr<ResultCache> cache;
};

TEST_F(RefreshSchedulerTest, RegisterRejectsNullAndDuplicates) {
	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY));
	EXPECT_THROW(scheduler.Register(nullptr), InvalidInputException);
	EXPECT_THROW(scheduler.Register(std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY)),
	             InvalidInputException);
	EXPECT_EQ(scheduler.Sources().size(), 1u);
}

TEST_F(RefreshSchedulerTest, OneFailingSourceDoesNotBlockOthers) {
	auto a = std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY);
	auto b = std::make_shared<CountingSource>("b", cache, Behavior::DOWN);
	auto c = std::make_shared<CountingSource>("c", cache, Behavior::BUGGY);
	auto d = std::make_shared<CountingSource>("d", cache, Behavior::HEALTHY);

	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(a);
	scheduler.Register(b);
	scheduler.Register(c);
	scheduler.Register(d);
	scheduler.RunCycle();

	EXPECT_EQ(scheduler.CycleCount(), 1u);
	EXPECT_EQ(a->fetches.load(), 1);
	EXPECT_EQ(b->fetches.load(), 1);
	EXPECT_EQ(c->fetches.load(), 1);
	EXPECT_EQ(d->fetches.load(), 1);

	FetchResult stored;
	ASSERT_TRUE(cache->TryGet("a", stored));
	EXPECT_EQ(stored.payload.GetInt("v"), 1);
	EXPECT_TRUE(cache->TryGet("d", stored));
	EXPECT_FALSE(cache->TryGet("b", stored));
	EXPECT_NE(b->LastError().find("upstream down"), std::string::npos);
}

TEST_F(RefreshSchedulerTest, DisabledSourcesAreSkipped) {
	auto enabled = std::make_shared<CountingSource>("on", cache, Behavior::HEALTHY);
	auto disabled = std::make_shared<CountingSource>("off", cache, Behavior::HEALTHY, false);

	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(enabled);
	scheduler.Register(disabled);
	scheduler.RunCycle();

	EXPECT_EQ(enabled->fetches.load(), 1);
	EXPECT_EQ(disabled->fetches.load(), 0);
}

TEST_F(RefreshSchedulerTest, ThrowingEnabledCheckDoesNotBlockOthers) {
	auto broken = std::make_shared<ToggleBugSource>("broken", cache);
	auto healthy = std::make_shared<CountingSource>("ok", cache, Behavior::HEALTHY);

	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(broken);
	scheduler.Register(healthy);
	EXPECT_NO_THROW(scheduler.RunCycle());

	EXPECT_EQ(broken->fetches.load(), 0);
	EXPECT_EQ(healthy->fetches.load(), 1);
	EXPECT_EQ(scheduler.CycleCount(), 1u);
}

TEST_F(RefreshSchedulerTest, FirstCycleRunsImmediatelyAndRepeats) {
	auto source = std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY);
	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(source);

	scheduler.Start();
	EXPECT_TRUE(scheduler.IsRunning());
	EXPECT_TRUE(WaitFor([&] { return source->fetches >= 1; }, std::chrono::seconds(2)));
	EXPECT_TRUE(WaitFor([&] { return source->fetches >= 3; }, std::chrono::seconds(5)));

	EXPECT_TRUE(scheduler.Stop(std::chrono::seconds(2)));
	EXPECT_FALSE(scheduler.IsRunning());

	auto after_stop = source->fetches.load();
	std::this_thread::sleep_for(std::chrono::milliseconds(150));
	EXPECT_EQ(source->fetches.load(), after_stop);
}

TEST_F(RefreshSchedulerTest, StopWakesASleepingLoop) {
	auto settings = FastSettings();
	settings.update_interval = std::chrono::hours(1);
	settings.check_interval = std::chrono::hours(1);

	auto source = std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY);
	RefreshScheduler scheduler(settings);
	scheduler.Register(source);
	scheduler.Start();
	ASSERT_TRUE(WaitFor([&] { return scheduler.CycleCount() >= 1; }, std::chrono::seconds(2)));

	auto begin = std::chrono::steady_clock::now();
	EXPECT_TRUE(scheduler.Stop(std::chrono::seconds(2)));
	EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}

TEST_F(RefreshSchedulerTest, RestartAfterStop) {
	auto source = std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY);
	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(source);

	// stopping a scheduler that never started is harmless
	EXPECT_TRUE(scheduler.Stop(std::chrono::milliseconds(10)));

	scheduler.Start();
	ASSERT_TRUE(WaitFor([&] { return source->fetches >= 1; }, std::chrono::seconds(2)));
	EXPECT_TRUE(scheduler.Stop(std::chrono::seconds(2)));

	auto before = source->fetches.load();
	scheduler.Start();
	EXPECT_TRUE(WaitFor([&] { return source->fetches > before; }, std::chrono::seconds(2)));
	EXPECT_TRUE(scheduler.Stop(std::chrono::seconds(2)));
	EXPECT_EQ(scheduler.Sources().size(), 1u);
}

TEST_F(RefreshSchedulerTest, UpdateIntervalCanChange) {
	RefreshScheduler scheduler(FastSettings());
	EXPECT_EQ(scheduler.UpdateInterval(), std::chrono::milliseconds(50));
	scheduler.SetUpdateInterval(std::chrono::seconds(600));
	EXPECT_EQ(scheduler.UpdateInterval(), std::chrono::seconds(600));
}

TEST_F(RefreshSchedulerTest, StopGivesUpOnAStuckSourceAndRestarts) {
	auto source = std::make_shared<SlowSource>("slow", cache, std::chrono::milliseconds(300));
	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(source);

	scheduler.Start();
	ASSERT_TRUE(WaitFor([&] { return source->fetches >= 1; }, std::chrono::seconds(2)));

	auto begin = std::chrono::steady_clock::now();
	EXPECT_FALSE(scheduler.Stop(std::chrono::milliseconds(20)));
	EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(250));
	EXPECT_FALSE(scheduler.IsRunning());

	scheduler.Start();
	EXPECT_TRUE(scheduler.IsRunning());
	EXPECT_TRUE(WaitFor([&] { return source->fetches >= 2; }, std::chrono::seconds(2)));
	EXPECT_TRUE(scheduler.Stop(std::chrono::seconds(2)));
	EXPECT_EQ(scheduler.Sources().size(), 1u);

	// the detached thread keeps the source alive; let its fetch finish before the test ends
	EXPECT_TRUE(WaitFor([&] { return source->completed.load() == source->fetches.load(); }, std::chrono::seconds(2)));
}

TEST_F(RefreshSchedulerTest, FailedIterationWaitsErrorBackoff) {
	auto settings = FastSettings();
	settings.update_interval = std::chrono::milliseconds(1);
	settings.check_interval = std::chrono::hours(1);
	settings.error_backoff = std::chrono::milliseconds(10);

	auto source = std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY);
	RefreshScheduler scheduler(settings);
	scheduler.Register(source);

	std::atomic<int> calls {0};
	std::atomic<uint64_t> last_count {0};
	scheduler.SetCycleCallback([&](uint64_t count) {
		calls++;
		last_count = count;
		throw std::runtime_error("display not ready");
	});

	// without the backoff the loop would sleep for the hour-long check interval after the first cycle
	scheduler.Start();
	EXPECT_TRUE(WaitFor([&] { return calls >= 3; }, std::chrono::seconds(2)));
	EXPECT_TRUE(scheduler.Stop(std::chrono::seconds(2)));
	EXPECT_GE(source->fetches.load(), 3);
	EXPECT_EQ(last_count.load(), scheduler.CycleCount());
}

TEST_F(RefreshSchedulerTest, CycleCallbackSeesEveryBackgroundCycle) {
	auto source = std::make_shared<CountingSource>("a", cache, Behavior::HEALTHY);
	RefreshScheduler scheduler(FastSettings());
	scheduler.Register(source);

	std::atomic<uint64_t> last_count {0};
	scheduler.SetCycleCallback([&](uint64_t count) { last_count = count; });
	scheduler.Start();
	EXPECT_TRUE(WaitFor([&] { return last_count >= 2; }, std::chrono::seconds(5)));
	EXPECT_TRUE(scheduler.Stop(std::chrono::seconds(2)));
	EXPECT_EQ(last_count.load(), scheduler.CycleCount());
}
