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

#ifndef __TRIGGERSCHEDULER_H__
#define __TRIGGERSCHEDULER_H__

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "AbstractTriggerSource.h"
#include "AcquisitionStatus.h"
#include "RingBuffer.h"
#include "TimingConfig.h"
#include "utilities/CallFrequency.h"
#include "utilities/SingleThreadTimer.h"

namespace hiprf
{
	/// Drives the trigger source at the configured period on its own thread.
	///
	/// Each cycle runs Idle -> Armed -> Firing -> Idle. The period is read from the
	/// TimingConfig when the Idle wait begins and governs the whole cycle, including the
	/// completion deadline of c_timeoutPeriods periods.
	///
	/// Every fired cycle gets its own acquisition index and thereby its own slot. Only
	/// committed acquisitions advance the acquisition counter. A cycle that times out, faults
	/// or fails to arm leaves its slot in the Writing state; the slot is reset when the write
	/// cursor returns to it.
	class TriggerScheduler
	{
	public:
		enum class State
		{
			Idle,
			Armed,
			Firing,
			Halted
		};

		typedef std::function<void(uint64_t)> AcquisitionCallback;
		typedef std::function<void(AcquisitionStatus)> TerminationCallback;

		TriggerScheduler(RingBuffer& ringBuffer, const TimingConfig& timingConfig, AbstractTriggerSource& triggerSource);
		~TriggerScheduler();

		/// Called on the acquisition thread with the new counter after every commit
		void setAcquisitionCallback(AcquisitionCallback callback);
		/// Called on the acquisition thread when the loop ends
		void setTerminationCallback(TerminationCallback callback);
		/// Stop after this many committed acquisitions, 0 for no limit
		void setAcquisitionLimit(uint64_t limit);

		void start();
		/// Requests the loop to end at the next cycle boundary, does not wait
		void stop();
		void join();

		bool isRunning() const { return m_running; }
		State getState() const { return m_state; }
		uint64_t getAcquisitionCounter() const { return m_acquisitionCounter; }
		uint64_t getNextAcquisitionIndex() const { return m_nextAcquisitionIndex; }
		AcquisitionStatus getTerminalStatus() const { return m_terminalStatus; }

		uint64_t getNumTimeouts() const { return m_numTimeouts; }
		uint64_t getNumLateCompletions() const { return m_numLateCompletions; }
		uint64_t getNumForcedResets() const { return m_numForcedResets; }
		double getMeasuredFrequency() const { return m_callFrequency.getFrequency(); }

		static constexpr uint32_t c_timeoutPeriods = 4;

	private:
		struct InFlightAcquisition
		{
			uint64_t acquisitionIndex;	// 0 if none is awaited
			SampleType* destination;
			size_t numSamples;
			bool done;
			bool fault;
			int faultCode;
		};

		void executionLoop();
		void acquire(const TimingParameters& timing);
		void onCompletion(const AcquisitionCompletion& completion);
		void releaseInFlight();
		void resetAbandonedSlot(size_t slotNumber);

		RingBuffer& m_ringBuffer;
		const TimingConfig& m_timingConfig;
		AbstractTriggerSource& m_triggerSource;

		AcquisitionCallback m_acquisitionCallback;
		TerminationCallback m_terminationCallback;
		uint64_t m_acquisitionLimit;

		std::thread m_thread;
		std::atomic<bool> m_running;
		std::atomic<bool> m_stopRequested;
		std::atomic<State> m_state;
		std::atomic<AcquisitionStatus> m_terminalStatus;

		std::atomic<uint64_t> m_acquisitionCounter;
		std::atomic<uint64_t> m_nextAcquisitionIndex;
		std::vector<uint64_t> m_abandonedAcquisitions;

		std::mutex m_completionMutex;
		std::condition_variable m_completionCondition;
		InFlightAcquisition m_inFlight;

		std::atomic<uint64_t> m_numTimeouts;
		std::atomic<uint64_t> m_numLateCompletions;
		std::atomic<uint64_t> m_numForcedResets;

		SingleThreadTimer m_timer;
		CallFrequency m_callFrequency;
	};
}

#endif //!__TRIGGERSCHEDULER_H__
