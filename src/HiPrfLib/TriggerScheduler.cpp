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

#include "TriggerScheduler.h"

#include <algorithm>
#include <chrono>
#include <string>

#include "utilities/Logging.h"
#include "utilities/utility.h"

namespace hiprf
{
	using namespace std::placeholders;
	using logging::log_error;
	using logging::log_info;
	using logging::log_log;
	using logging::log_warn;

	constexpr uint32_t TriggerScheduler::c_timeoutPeriods;

	TriggerScheduler::TriggerScheduler(RingBuffer& ringBuffer, const TimingConfig& timingConfig, AbstractTriggerSource& triggerSource)
		: m_ringBuffer(ringBuffer)
		, m_timingConfig(timingConfig)
		, m_triggerSource(triggerSource)
		, m_acquisitionLimit(0)
		, m_running(false)
		, m_stopRequested(false)
		, m_state(State::Idle)
		, m_terminalStatus(AcquisitionStatus::Ok)
		, m_acquisitionCounter(0)
		, m_nextAcquisitionIndex(1)
		, m_abandonedAcquisitions(ringBuffer.getCapacity(), 0)
		, m_numTimeouts(0)
		, m_numLateCompletions(0)
		, m_numForcedResets(0)
		, m_callFrequency("Acquisition")
	{
		m_inFlight.acquisitionIndex = 0;
		m_inFlight.destination = nullptr;
		m_inFlight.numSamples = 0;
		m_inFlight.done = false;
		m_inFlight.fault = false;
		m_inFlight.faultCode = 0;

		m_triggerSource.setCompletionCallback(std::bind(&TriggerScheduler::onCompletion, this, _1));
	}

	TriggerScheduler::~TriggerScheduler()
	{
		stop();
		join();
		m_triggerSource.setCompletionCallback(AbstractTriggerSource::CompletionCallback());
	}

	void TriggerScheduler::setAcquisitionCallback(AcquisitionCallback callback)
	{
		m_acquisitionCallback = callback;
	}

	void TriggerScheduler::setTerminationCallback(TerminationCallback callback)
	{
		m_terminationCallback = callback;
	}

	void TriggerScheduler::setAcquisitionLimit(uint64_t limit)
	{
		m_acquisitionLimit = limit;
	}

	void TriggerScheduler::start()
	{
		if (m_running)
		{
			log_warn("TriggerScheduler: start() while already running, ignored");
			return;
		}
		join();

		m_stopRequested = false;
		m_terminalStatus = AcquisitionStatus::Ok;
		m_state = State::Idle;
		m_running = true;
		m_thread = std::thread(&TriggerScheduler::executionLoop, this);
	}

	void TriggerScheduler::stop()
	{
		m_stopRequested = true;
	}

	void TriggerScheduler::join()
	{
		if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id())
		{
			m_thread.join();
		}
	}

	void TriggerScheduler::executionLoop()
	{
		AcquisitionStatus status = AcquisitionStatus::Stopped;
		log_info("TriggerScheduler: Acquisition started at index ", m_nextAcquisitionIndex);

		try
		{
			m_timer.reset();
			while (!m_stopRequested)
			{
				m_state = State::Idle;
				// the period of this cycle, changes apply from the next cycle on
				TimingParameters timing = m_timingConfig.get();
				m_timer.sleepUntilNextSlot(timing.periodMicroseconds);
				if (m_stopRequested)
				{
					break;
				}

				m_callFrequency.measure();
				acquire(timing);
				m_callFrequency.measureEnd();

				if (m_acquisitionLimit > 0 && m_acquisitionCounter >= m_acquisitionLimit)
				{
					log_info("TriggerScheduler: Reached the limit of ", m_acquisitionLimit, " acquisitions");
					break;
				}
			}
		}
		catch (const AcquisitionException& e)
		{
			status = e.getStatus();
			log_error("TriggerScheduler: Acquisition halted with ", status, ": ", e.what());
		}
		catch (const std::exception& e)
		{
			status = AcquisitionStatus::InternalError;
			log_error("TriggerScheduler: Acquisition halted by unexpected exception: ", e.what());
		}

		m_terminalStatus = status;
		m_state = State::Halted;
		log_info("TriggerScheduler: Acquisition ended with ", status, " after ", m_acquisitionCounter,
			" acquisitions, ", m_numTimeouts, " timeouts, ", m_timer.getNumResynchronizations(), " missed slots");

		if (m_terminationCallback)
		{
			try
			{
				m_terminationCallback(status);
			}
			catch (const std::exception& e)
			{
				log_error("TriggerScheduler: Termination callback threw: ", e.what());
			}
		}
		m_running = false;
	}

	void TriggerScheduler::acquire(const TimingParameters& timing)
	{
		uint64_t acquisitionIndex = m_nextAcquisitionIndex;
		size_t slotNumber = m_ringBuffer.getSlotNumber(acquisitionIndex);
		resetAbandonedSlot(slotNumber);

		WritableSlot slot = m_ringBuffer.write(acquisitionIndex);
		// every started cycle consumes its index and counts as abandoned until it is committed
		m_nextAcquisitionIndex = acquisitionIndex + 1;
		m_abandonedAcquisitions[slotNumber] = acquisitionIndex;
		{
			std::lock_guard<std::mutex> lock(m_completionMutex);
			m_inFlight.acquisitionIndex = acquisitionIndex;
			m_inFlight.destination = slot.get();
			m_inFlight.numSamples = slot.size();
			m_inFlight.done = false;
			m_inFlight.fault = false;
			m_inFlight.faultCode = 0;
		}

		double timestamp = 0.0;
		SingleThreadTimer::clock::time_point deadline;
		try
		{
			m_state = State::Armed;
			SlotDescriptor descriptor;
			descriptor.acquisitionIndex = acquisitionIndex;
			descriptor.slotNumber = slotNumber;
			descriptor.destination = slot.get();
			descriptor.shape = m_ringBuffer.getShape();
			m_triggerSource.arm(descriptor);

			m_state = State::Firing;
			timestamp = getCurrentTime();
			deadline = SingleThreadTimer::clock::now() +
				std::chrono::microseconds(static_cast<int64_t>(c_timeoutPeriods) * timing.periodMicroseconds);
			m_triggerSource.fire();
		}
		catch (...)
		{
			releaseInFlight();
			throw;
		}

		bool completed;
		bool fault;
		int faultCode;
		{
			std::unique_lock<std::mutex> lock(m_completionMutex);
			completed = m_completionCondition.wait_until(lock, deadline, [this] { return m_inFlight.done; });
			fault = m_inFlight.fault;
			faultCode = m_inFlight.faultCode;
			// completions arriving from now on are late
			m_inFlight.acquisitionIndex = 0;
			m_inFlight.destination = nullptr;
		}

		if (!completed)
		{
			m_numTimeouts++;
			log_warn("TriggerScheduler: ", AcquisitionStatus::AcquisitionTimeout, " for acquisition ", acquisitionIndex,
				" after ", c_timeoutPeriods * timing.periodMicroseconds, " us, dropping the cycle");
			return;
		}
		if (fault)
		{
			throw AcquisitionException(AcquisitionStatus::HardwareFault,
				"trigger source reported fault " + std::to_string(faultCode) +
				" for acquisition " + std::to_string(acquisitionIndex));
		}

		m_ringBuffer.commit(slot, timestamp);
		m_abandonedAcquisitions[slotNumber] = 0;
		uint64_t counter = ++m_acquisitionCounter;
		if (m_acquisitionCallback)
		{
			m_acquisitionCallback(counter);
		}
	}

	void TriggerScheduler::onCompletion(const AcquisitionCompletion& completion)
	{
		std::lock_guard<std::mutex> lock(m_completionMutex);
		if (completion.acquisitionIndex == 0 ||
			completion.acquisitionIndex != m_inFlight.acquisitionIndex ||
			m_inFlight.done)
		{
			m_numLateCompletions++;
			log_log("TriggerScheduler: Ignored completion of acquisition ", completion.acquisitionIndex,
				", it is not awaited anymore");
			return;
		}

		m_inFlight.fault = completion.fault;
		m_inFlight.faultCode = completion.faultCode;
		if (!completion.fault && completion.payload)
		{
			if (completion.numSamples != m_inFlight.numSamples)
			{
				log_error("TriggerScheduler: Acquisition ", completion.acquisitionIndex, " delivered ",
					completion.numSamples, " samples, expected ", m_inFlight.numSamples);
				m_inFlight.fault = true;
				m_inFlight.faultCode = -1;
			}
			else
			{
				std::copy(completion.payload, completion.payload + completion.numSamples, m_inFlight.destination);
			}
		}
		m_inFlight.done = true;
		m_completionCondition.notify_one();
	}

	void TriggerScheduler::releaseInFlight()
	{
		std::lock_guard<std::mutex> lock(m_completionMutex);
		m_inFlight.acquisitionIndex = 0;
		m_inFlight.destination = nullptr;
	}

	void TriggerScheduler::resetAbandonedSlot(size_t slotNumber)
	{
		uint64_t abandoned = m_abandonedAcquisitions[slotNumber];
		if (abandoned == 0)
		{
			return;
		}
		m_ringBuffer.forceReset(abandoned);
		m_abandonedAcquisitions[slotNumber] = 0;
		m_numForcedResets++;
		log_log("TriggerScheduler: Reset slot ", slotNumber, " abandoned by acquisition ", abandoned);
	}
}
