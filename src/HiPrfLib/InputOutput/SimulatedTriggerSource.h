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

#ifndef __SIMULATEDTRIGGERSOURCE_H__
#define __SIMULATEDTRIGGERSOURCE_H__

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "AbstractTriggerSource.h"
#include "AcquisitionGeometry.h"
#include "utilities/SingleThreadTimer.h"

namespace hiprf
{
	/// Trigger source without hardware. Every fired acquisition completes after a fixed
	/// latency on a worker thread. The active receive element records the echo of a point
	/// target that moves back and forth along depth, all other channels stay silent.
	class SimulatedTriggerSource : public AbstractTriggerSource
	{
	public:
		SimulatedTriggerSource(const AcquisitionGeometry& geometry, uint32_t rxElement, uint32_t latencyMicroseconds);
		virtual ~SimulatedTriggerSource();

		virtual void setCompletionCallback(CompletionCallback callback);
		virtual void arm(const SlotDescriptor& slot);
		virtual void fire();

		/// The acquisition with this index completes with the given fault code
		void injectFault(uint64_t acquisitionIndex, int faultCode);
		/// The acquisition with this index never completes
		void injectTimeout(uint64_t acquisitionIndex);

		uint32_t getRxElement() const { return m_rxElement; }
		uint32_t getLatency() const { return m_latency; }
		uint64_t getNumFired() const { return m_numFired; }
		uint64_t getNumCompleted() const { return m_numCompleted; }

		/// Depth of the simulated target for an acquisition [wavelengths]
		double getTargetDepth(uint64_t acquisitionIndex) const;

		static constexpr SampleType c_echoAmplitude = 8000;
		static constexpr uint64_t c_targetMotionPeriod = 5000;	// [acquisitions]

	private:
		struct PendingAcquisition
		{
			uint64_t acquisitionIndex;
			SingleThreadTimer::clock::time_point due;
		};

		void executionLoop();
		void synthesizeEcho(uint64_t acquisitionIndex);
		void complete(const AcquisitionCompletion& completion);

		AcquisitionGeometry m_geometry;
		uint32_t m_rxElement;
		uint32_t m_latency;

		std::thread m_thread;
		std::atomic<bool> m_running;

		std::mutex m_objMutex;
		std::condition_variable m_pendingCondition;
		std::deque<PendingAcquisition> m_pending;
		uint64_t m_armedIndex;
		std::map<uint64_t, int> m_injectedFaults;
		std::set<uint64_t> m_injectedTimeouts;

		std::mutex m_callbackMutex;
		CompletionCallback m_callback;

		// touched by the worker thread only
		std::vector<SampleType> m_payload;

		std::atomic<uint64_t> m_numFired;
		std::atomic<uint64_t> m_numCompleted;
	};
}

#endif //!__SIMULATEDTRIGGERSOURCE_H__
