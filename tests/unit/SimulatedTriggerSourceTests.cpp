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
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "InputOutput/SimulatedTriggerSource.h"

using namespace hiprf;

namespace
{
	typedef std::chrono::steady_clock SteadyClock;

	struct ReceivedCompletion
	{
		uint64_t acquisitionIndex;
		bool fault;
		int faultCode;
		std::vector<SampleType> samples;
		SteadyClock::time_point time;
	};

	/// Collects the completions reported by the worker thread
	class CompletionCollector
	{
	public:
		AbstractTriggerSource::CompletionCallback callback()
		{
			return [this](const AcquisitionCompletion& completion) {
				ReceivedCompletion received;
				received.acquisitionIndex = completion.acquisitionIndex;
				received.fault = completion.fault;
				received.faultCode = completion.faultCode;
				if (completion.payload)
				{
					received.samples.assign(completion.payload, completion.payload + completion.numSamples);
				}
				received.time = SteadyClock::now();

				std::lock_guard<std::mutex> lock(m_mutex);
				m_completions.push_back(received);
				m_condition.notify_all();
			};
		}

		bool waitFor(size_t numCompletions, std::chrono::milliseconds timeout)
		{
			std::unique_lock<std::mutex> lock(m_mutex);
			return m_condition.wait_for(lock, timeout, [this, numCompletions] { return m_completions.size() >= numCompletions; });
		}

		std::vector<ReceivedCompletion> get()
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			return m_completions;
		}

	private:
		std::mutex m_mutex;
		std::condition_variable m_condition;
		std::vector<ReceivedCompletion> m_completions;
	};

	AcquisitionGeometry simulatedGeometry()
	{
		AcquisitionGeometry geometry;
		geometry.startDepth = 5.0;
		geometry.endDepth = 50.0;
		geometry.centerFrequency = 6.25;
		geometry.speedOfSound = 1540.0;
		geometry.frameShape = FrameShape{ 256, 8 };
		geometry.transferRate = 6600.0;
		geometry.setupOverhead = 10.0;
		return geometry;
	}

	SlotDescriptor slotFor(uint64_t acquisitionIndex, const FrameShape& shape)
	{
		SlotDescriptor slot;
		slot.acquisitionIndex = acquisitionIndex;
		slot.slotNumber = 0;
		slot.destination = nullptr;
		slot.shape = shape;
		return slot;
	}

	void armAndFire(SimulatedTriggerSource& source, uint64_t acquisitionIndex)
	{
		source.arm(slotFor(acquisitionIndex, simulatedGeometry().frameShape));
		source.fire();
	}
}

TEST(SimulatedTriggerSourceTests, RejectsInvalidSetup) {
	AcquisitionGeometry inverted = simulatedGeometry();
	inverted.endDepth = 1.0;
	EXPECT_THROW(SimulatedTriggerSource(inverted, 0, 10), std::invalid_argument);
	EXPECT_THROW(SimulatedTriggerSource(simulatedGeometry(), 8, 10), std::invalid_argument);
}

TEST(SimulatedTriggerSourceTests, RejectsSlotsOfAnotherShape) {
	SimulatedTriggerSource source(simulatedGeometry(), 3, 10);
	EXPECT_THROW(source.arm(slotFor(1, FrameShape{ 128, 8 })), std::invalid_argument);
}

TEST(SimulatedTriggerSourceTests, CompletesAfterTheLatency) {
	CompletionCollector collector;
	SimulatedTriggerSource source(simulatedGeometry(), 3, 2000);
	source.setCompletionCallback(collector.callback());

	SteadyClock::time_point fired = SteadyClock::now();
	armAndFire(source, 1);
	ASSERT_TRUE(collector.waitFor(1, std::chrono::milliseconds(1000)));

	std::vector<ReceivedCompletion> completions = collector.get();
	ASSERT_EQ(completions.size(), 1u);
	EXPECT_EQ(completions[0].acquisitionIndex, 1u);
	EXPECT_FALSE(completions[0].fault);
	EXPECT_GE(std::chrono::duration_cast<std::chrono::microseconds>(completions[0].time - fired).count(), 2000);
	EXPECT_EQ(source.getNumFired(), 1u);
	EXPECT_EQ(source.getNumCompleted(), 1u);
}

TEST(SimulatedTriggerSourceTests, EchoOnlyOnTheReceiveElement) {
	const uint32_t rxElement = 3;
	AcquisitionGeometry geometry = simulatedGeometry();
	CompletionCollector collector;
	SimulatedTriggerSource source(geometry, rxElement, 10);
	source.setCompletionCallback(collector.callback());

	armAndFire(source, 1);
	ASSERT_TRUE(collector.waitFor(1, std::chrono::milliseconds(1000)));
	std::vector<SampleType> samples = collector.get()[0].samples;
	ASSERT_EQ(samples.size(), geometry.frameShape.getNumSamples());

	size_t numRows = geometry.frameShape.numRows;
	int peak = 0;
	size_t peakRow = 0;
	for (size_t channel = 0; channel < geometry.frameShape.numChannels; channel++)
	{
		for (size_t row = 0; row < numRows; row++)
		{
			int sample = samples[channel * numRows + row];
			if (channel != rxElement)
			{
				EXPECT_EQ(sample, 0) << "channel " << channel << ", row " << row;
			}
			else if (std::abs(sample) > peak)
			{
				peak = std::abs(sample);
				peakRow = row;
			}
		}
	}

	EXPECT_GT(peak, SimulatedTriggerSource::c_echoAmplitude / 2);
	EXPECT_LE(peak, SimulatedTriggerSource::c_echoAmplitude);
	// the echo is centered on the target
	double rowDepth = (geometry.endDepth - geometry.startDepth) / numRows;
	double peakDepth = geometry.startDepth + peakRow * rowDepth;
	EXPECT_NEAR(peakDepth, source.getTargetDepth(1), 1.0);
}

TEST(SimulatedTriggerSourceTests, TargetMovesWithinTheImagedDepth) {
	SimulatedTriggerSource source(simulatedGeometry(), 0, 10);
	EXPECT_DOUBLE_EQ(source.getTargetDepth(0), 27.5);
	EXPECT_NEAR(source.getTargetDepth(SimulatedTriggerSource::c_targetMotionPeriod / 4), 38.75, 1e-9);
	EXPECT_NEAR(source.getTargetDepth(3 * SimulatedTriggerSource::c_targetMotionPeriod / 4), 16.25, 1e-9);
	EXPECT_DOUBLE_EQ(source.getTargetDepth(SimulatedTriggerSource::c_targetMotionPeriod + 7), source.getTargetDepth(7));

	for (uint64_t k = 0; k < SimulatedTriggerSource::c_targetMotionPeriod; k += 97)
	{
		EXPECT_GT(source.getTargetDepth(k), 5.0);
		EXPECT_LT(source.getTargetDepth(k), 50.0);
	}
}

TEST(SimulatedTriggerSourceTests, InjectedFaultsAndTimeouts) {
	CompletionCollector collector;
	SimulatedTriggerSource source(simulatedGeometry(), 3, 10);
	source.setCompletionCallback(collector.callback());
	source.injectFault(2, 42);
	source.injectTimeout(3);

	for (uint64_t k = 1; k <= 4; k++)
	{
		armAndFire(source, k);
	}
	ASSERT_TRUE(collector.waitFor(3, std::chrono::milliseconds(1000)));
	// give a completion of acquisition 3 the chance to show up
	std::this_thread::sleep_for(std::chrono::milliseconds(5));

	std::vector<ReceivedCompletion> completions = collector.get();
	ASSERT_EQ(completions.size(), 3u);
	EXPECT_EQ(completions[0].acquisitionIndex, 1u);
	EXPECT_FALSE(completions[0].fault);

	EXPECT_EQ(completions[1].acquisitionIndex, 2u);
	EXPECT_TRUE(completions[1].fault);
	EXPECT_EQ(completions[1].faultCode, 42);
	EXPECT_TRUE(completions[1].samples.empty());

	EXPECT_EQ(completions[2].acquisitionIndex, 4u);
	EXPECT_EQ(source.getNumFired(), 4u);
	EXPECT_EQ(source.getNumCompleted(), 3u);
}

TEST(SimulatedTriggerSourceTests, FireWithoutArmIsIgnored) {
	CompletionCollector collector;
	SimulatedTriggerSource source(simulatedGeometry(), 3, 10);
	source.setCompletionCallback(collector.callback());

	source.fire();
	armAndFire(source, 1);
	source.fire();
	ASSERT_TRUE(collector.waitFor(1, std::chrono::milliseconds(1000)));
	std::this_thread::sleep_for(std::chrono::milliseconds(5));

	EXPECT_EQ(collector.get().size(), 1u);
	EXPECT_EQ(source.getNumFired(), 1u);
}

TEST(SimulatedTriggerSourceTests, DetachedReceiverGetsNothing) {
	CompletionCollector collector;
	SimulatedTriggerSource source(simulatedGeometry(), 3, 10);
	source.setCompletionCallback(collector.callback());
	source.setCompletionCallback(AbstractTriggerSource::CompletionCallback());

	armAndFire(source, 1);
	EXPECT_FALSE(collector.waitFor(1, std::chrono::milliseconds(20)));
}
