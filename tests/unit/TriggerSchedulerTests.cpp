// ================================================================================================
//
// If not explicitly stated: Copyright (C) 2016, all rights reserved,
//      Rüdiger Göbl
//		Email r.goebl@tum.de
//      Chair for Computer Aided Medical Procedures
//      Technische Universität München
//      Boltzmannstr. 3, 85748 Garching b. München, Germany
//
// ================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "FakeTriggerSource.h"
#include "RingBuffer.h"
#include "TimingConfig.h"
#include "TriggerScheduler.h"

using namespace hiprf;
using namespace hiprf::mocks;

namespace
{
	const FrameShape c_shape = { 16, 4 };

	double milliseconds(FakeTriggerSource::clock::duration duration)
	{
		return std::chrono::duration<double, std::milli>(duration).count();
	}

	class TriggerSchedulerTests : public ::testing::Test {
	protected:
		TriggerSchedulerTests()
			: buffer(8, c_shape)
			, timing(TimingParameters{ 200, 100, 200 }) {}

		void recordTermination(TriggerScheduler& scheduler)
		{
			scheduler.setTerminationCallback([this](AcquisitionStatus status) {
				std::lock_guard<std::mutex> lock(terminationMutex);
				terminations.push_back(status);
			});
		}

		std::vector<AcquisitionStatus> getTerminations()
		{
			std::lock_guard<std::mutex> lock(terminationMutex);
			return terminations;
		}

		bool holdsPattern(uint64_t acquisitionIndex)
		{
			auto frame = buffer.readComplete(acquisitionIndex);
			if (!frame)
			{
				return false;
			}
			SampleType expected = FakeTriggerSource::samplePattern(acquisitionIndex);
			return std::all_of(frame->get(), frame->get() + frame->size(),
				[expected](SampleType sample) { return sample == expected; });
		}

		RingBuffer buffer;
		TimingConfig timing;
		FakeTriggerSource source;

		std::mutex terminationMutex;
		std::vector<AcquisitionStatus> terminations;
	};
}

//==============================================================================
// Regular operation
//==============================================================================

TEST_F(TriggerSchedulerTests, CommitsAcquisitionsInOrder) {
	TriggerScheduler scheduler(buffer, timing, source);
	std::vector<uint64_t> counters;
	scheduler.setAcquisitionCallback([&counters](uint64_t counter) { counters.push_back(counter); });
	recordTermination(scheduler);
	scheduler.setAcquisitionLimit(20);

	scheduler.start();
	scheduler.join();

	EXPECT_FALSE(scheduler.isRunning());
	EXPECT_EQ(scheduler.getState(), TriggerScheduler::State::Halted);
	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::Stopped);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 20u);
	EXPECT_EQ(scheduler.getNextAcquisitionIndex(), 21u);
	EXPECT_EQ(scheduler.getNumTimeouts(), 0u);

	std::vector<uint64_t> expected;
	for (uint64_t k = 1; k <= 20; k++)
	{
		expected.push_back(k);
	}
	EXPECT_EQ(counters, expected);
	EXPECT_EQ(source.getFiredIndices(), expected);
	EXPECT_EQ(source.getArmedIndices(), expected);
	EXPECT_EQ(getTerminations(), std::vector<AcquisitionStatus>{ AcquisitionStatus::Stopped });

	EXPECT_EQ(buffer.getLatestCompleteIndex(), 20u);
	for (uint64_t k = 13; k <= 20; k++)
	{
		EXPECT_TRUE(holdsPattern(k)) << "acquisition " << k;
	}
}

TEST_F(TriggerSchedulerTests, SourceCanWriteIntoTheSlot) {
	source.setWriteInPlace(true);
	TriggerScheduler scheduler(buffer, timing, source);
	scheduler.setAcquisitionLimit(10);

	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getAcquisitionCounter(), 10u);
	for (uint64_t k = 3; k <= 10; k++)
	{
		EXPECT_TRUE(holdsPattern(k)) << "acquisition " << k;
	}
}

TEST_F(TriggerSchedulerTests, FiresAtTheConfiguredPeriod) {
	timing.publish(TimingParameters{ 5000, 100, 200 });
	TriggerScheduler scheduler(buffer, timing, source);
	scheduler.setAcquisitionLimit(5);

	scheduler.start();
	scheduler.join();

	std::vector<FakeTriggerSource::clock::time_point> fireTimes = source.getFireTimes();
	ASSERT_EQ(fireTimes.size(), 5u);
	// the timer never fires early
	EXPECT_GE(milliseconds(fireTimes.back() - fireTimes.front()), 4 * 5.0 - 0.01);
}

//==============================================================================
// Faults and timeouts
//==============================================================================

TEST_F(TriggerSchedulerTests, HardwareFaultHaltsTheScheduler) {
	source.failAcquisition(5, 17);
	TriggerScheduler scheduler(buffer, timing, source);
	recordTermination(scheduler);

	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::HardwareFault);
	EXPECT_EQ(scheduler.getState(), TriggerScheduler::State::Halted);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 4u);
	EXPECT_EQ(source.getNumFired(), 5u);
	EXPECT_EQ(getTerminations(), std::vector<AcquisitionStatus>{ AcquisitionStatus::HardwareFault });
	EXPECT_EQ(buffer.getLatestCompleteIndex(), 4u);
	EXPECT_EQ(buffer.readComplete(5), nullptr);
}

TEST_F(TriggerSchedulerTests, TimeoutDropsTheCycleAndContinues) {
	source.dropAcquisition(3);
	TriggerScheduler scheduler(buffer, timing, source);
	recordTermination(scheduler);
	scheduler.setAcquisitionLimit(10);

	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::Stopped);
	EXPECT_EQ(scheduler.getNumTimeouts(), 1u);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 10u);
	// the dropped cycle keeps its index
	EXPECT_EQ(source.getNumFired(), 11u);
	EXPECT_EQ(buffer.readComplete(3), nullptr);
	EXPECT_EQ(buffer.getLatestCompleteIndex(), 11u);
	EXPECT_EQ(getTerminations(), std::vector<AcquisitionStatus>{ AcquisitionStatus::Stopped });
}

TEST_F(TriggerSchedulerTests, AbandonedSlotIsResetOnWraparound) {
	RingBuffer small(4, c_shape);
	source.dropAcquisition(2);
	TriggerScheduler scheduler(small, timing, source);
	scheduler.setAcquisitionLimit(8);

	scheduler.start();
	scheduler.join();

	// acquisition 6 reuses the slot abandoned by acquisition 2
	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::Stopped);
	EXPECT_EQ(scheduler.getNumTimeouts(), 1u);
	EXPECT_EQ(scheduler.getNumForcedResets(), 1u);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 8u);
	EXPECT_EQ(small.getLatestCompleteIndex(), 9u);
	EXPECT_EQ(small.getSlotState(2), SlotState::Complete);
}

TEST_F(TriggerSchedulerTests, ArmFailureDoesNotBlockTheRestart) {
	RingBuffer small(4, c_shape);
	source.failArm(3);
	TriggerScheduler scheduler(small, timing, source);
	recordTermination(scheduler);
	scheduler.setAcquisitionLimit(10);

	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::InternalError);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 2u);
	EXPECT_EQ(scheduler.getNextAcquisitionIndex(), 4u);
	EXPECT_EQ(small.getSlotState(3), SlotState::Writing);

	// acquisition 7 reuses the slot left behind by acquisition 3
	scheduler.setAcquisitionLimit(8);
	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::Stopped);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 8u);
	EXPECT_EQ(scheduler.getNumForcedResets(), 1u);
	EXPECT_EQ(source.getArmedIndices(), (std::vector<uint64_t>{ 1, 2, 4, 5, 6, 7, 8, 9 }));
	EXPECT_EQ(small.getLatestCompleteIndex(), 9u);
	EXPECT_EQ(small.getSlotState(3), SlotState::Complete);
	EXPECT_EQ(getTerminations(), (std::vector<AcquisitionStatus>{ AcquisitionStatus::InternalError, AcquisitionStatus::Stopped }));
}

TEST_F(TriggerSchedulerTests, LateCompletionIsIgnored) {
	timing.publish(TimingParameters{ 1000, 100, 200 });
	// completes after twice the timeout of 4 ms
	source.delayAcquisition(3, std::chrono::milliseconds(8));
	TriggerScheduler scheduler(buffer, timing, source);
	scheduler.setAcquisitionLimit(6);

	scheduler.start();
	scheduler.join();
	source.joinDelayed();

	EXPECT_EQ(scheduler.getNumTimeouts(), 1u);
	EXPECT_EQ(scheduler.getNumLateCompletions(), 1u);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 6u);
	EXPECT_EQ(buffer.readComplete(3), nullptr);
	EXPECT_TRUE(holdsPattern(7));
}

TEST_F(TriggerSchedulerTests, CompletionOfUnknownAcquisitionIsIgnored) {
	TriggerScheduler scheduler(buffer, timing, source);
	source.sendCompletion(42);
	source.sendCompletion(0);
	EXPECT_EQ(scheduler.getNumLateCompletions(), 2u);
	EXPECT_EQ(buffer.getLatestCompleteIndex(), 0u);
}

TEST_F(TriggerSchedulerTests, ThrowingCallbackIsAnInternalError) {
	TriggerScheduler scheduler(buffer, timing, source);
	recordTermination(scheduler);
	scheduler.setAcquisitionCallback([](uint64_t counter) {
		if (counter == 3)
		{
			throw std::runtime_error("consumer failed");
		}
	});

	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::InternalError);
	EXPECT_EQ(scheduler.getAcquisitionCounter(), 3u);
	EXPECT_EQ(getTerminations(), std::vector<AcquisitionStatus>{ AcquisitionStatus::InternalError });
}

//==============================================================================
// Rate changes
//==============================================================================

TEST_F(TriggerSchedulerTests, PeriodChangeAppliesFromTheNextCycle) {
	timing.publish(TimingParameters{ 20000, 100, 200 });
	source.setFireHook([this](uint64_t acquisitionIndex) {
		if (acquisitionIndex == 3)
		{
			timing.publish(TimingParameters{ 2000, 100, 200 });
		}
	});
	TriggerScheduler scheduler(buffer, timing, source);
	scheduler.setAcquisitionLimit(5);

	scheduler.start();
	scheduler.join();

	ASSERT_EQ(scheduler.getAcquisitionCounter(), 5u);
	std::vector<FakeTriggerSource::clock::time_point> fireTimes = source.getFireTimes();
	ASSERT_EQ(fireTimes.size(), 5u);

	// cycle 3 still runs at the old period and is committed normally
	EXPECT_GE(milliseconds(fireTimes[2] - fireTimes[1]), 19.9);
	EXPECT_TRUE(holdsPattern(3));
	EXPECT_LT(milliseconds(fireTimes[3] - fireTimes[2]), 15.0);
	EXPECT_GE(milliseconds(fireTimes[3] - fireTimes[2]), 1.9);
	EXPECT_EQ(scheduler.getNumTimeouts(), 0u);
}

//==============================================================================
// Lifecycle
//==============================================================================

TEST_F(TriggerSchedulerTests, StopFromTheAcquisitionCallback) {
	TriggerScheduler scheduler(buffer, timing, source);
	scheduler.setAcquisitionCallback([&scheduler](uint64_t counter) {
		if (counter == 5)
		{
			scheduler.stop();
		}
	});

	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getAcquisitionCounter(), 5u);
	EXPECT_EQ(source.getNumFired(), 5u);
	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::Stopped);
}

TEST_F(TriggerSchedulerTests, RestartContinuesTheIndices) {
	TriggerScheduler scheduler(buffer, timing, source);
	scheduler.setAcquisitionLimit(5);
	scheduler.start();
	scheduler.join();

	scheduler.setAcquisitionLimit(8);
	scheduler.start();
	scheduler.join();

	EXPECT_EQ(scheduler.getAcquisitionCounter(), 8u);
	EXPECT_EQ(source.getFiredIndices(), (std::vector<uint64_t>{ 1, 2, 3, 4, 5, 6, 7, 8 }));
	EXPECT_EQ(buffer.getLatestCompleteIndex(), 8u);
}

TEST_F(TriggerSchedulerTests, SecondStartIsIgnored) {
	TriggerScheduler scheduler(buffer, timing, source);
	scheduler.start();
	scheduler.start();
	EXPECT_TRUE(scheduler.isRunning());

	std::this_thread::sleep_for(std::chrono::milliseconds(5));
	scheduler.stop();
	scheduler.join();
	EXPECT_FALSE(scheduler.isRunning());
	EXPECT_EQ(scheduler.getTerminalStatus(), AcquisitionStatus::Stopped);
}

TEST_F(TriggerSchedulerTests, DestructionStopsTheLoop) {
	{
		TriggerScheduler scheduler(buffer, timing, source);
		scheduler.start();
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	size_t numFired = source.getNumFired();
	EXPECT_GT(numFired, 0u);

	std::this_thread::sleep_for(std::chrono::milliseconds(5));
	EXPECT_EQ(source.getNumFired(), numFired);
}
