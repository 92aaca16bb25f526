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

#ifndef __THROTTLEDDISPATCHER_H__
#define __THROTTLEDDISPATCHER_H__

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tbb/flow_graph.h>
#include <tbb/task_arena.h>

#include "AbstractProcessingSink.h"
#include "Frame.h"
#include "RingBuffer.h"
#include "TimingConfig.h"
#include "utilities/CallFrequency.h"

namespace hiprf
{
	enum class DispatchPolicy
	{
		SkipWhenBusy,	// a dispatch point that finds the sink busy is dropped
		StrictCadence	// a dispatch point that finds the sink busy is retried on every following acquisition
	};

	const char* dispatchPolicyToString(DispatchPolicy policy);
	/// Accepts "skip" and "strict", returns false for anything else
	bool dispatchPolicyFromString(const std::string& name, DispatchPolicy& policy);

	/// Decimates the acquisition stream for the processing stage and hands control to the
	/// supervisor at a fixed cadence.
	///
	/// onAcquisition() runs on the acquisition thread right after each commit. At every
	/// processing cadence it forwards the most recent complete frame to the sink, which sits
	/// behind a rejecting flow graph node with concurrency 1. The acquisition thread never waits
	/// for the sink: if it is still busy, the frame is not delivered.
	///
	/// The graph lives in the dispatcher's own arena. Its sink thread joins the arena whenever a
	/// frame was accepted, so the sink makes progress even when TBB has no worker threads.
	class ThrottledDispatcher
	{
	public:
		typedef tbb::flow::function_node<std::shared_ptr<const Frame>, tbb::flow::continue_msg, tbb::flow::rejecting> NodeTypeDiscarding;
		typedef std::function<void(uint64_t)> ControlCallback;

		ThrottledDispatcher(const RingBuffer& ringBuffer, const TimingConfig& timingConfig,
			AbstractProcessingSink& sink, DispatchPolicy policy = DispatchPolicy::SkipWhenBusy);
		~ThrottledDispatcher();

		/// Runs synchronously on the acquisition thread at every control cadence
		void setControlCallback(ControlCallback callback);
		void setPolicy(DispatchPolicy policy) { m_policy = policy; }
		DispatchPolicy getPolicy() const { return m_policy; }

		void onAcquisition(uint64_t acquisitionCounter);
		/// Blocks until the sink has finished all accepted frames. Not for the acquisition thread.
		void waitForSink();

		static bool isDispatchPoint(uint64_t acquisitionCounter, uint32_t processingCadence)
		{
			return processingCadence > 0 && acquisitionCounter % processingCadence == 0;
		}
		static bool isControlPoint(uint64_t acquisitionCounter, uint32_t controlCadence)
		{
			return controlCadence > 0 && acquisitionCounter % controlCadence == 0;
		}

		uint64_t getNumDispatched() const { return m_numDispatched; }
		uint64_t getNumSkipped() const { return m_numSkipped; }
		uint64_t getNumRescheduled() const { return m_numRescheduled; }
		uint64_t getNumEmpty() const { return m_numEmpty; }
		uint64_t getNumControlCheckpoints() const { return m_numControlCheckpoints; }
		uint64_t getNumSinkErrors() const { return m_numSinkErrors; }
		uint64_t getLastDispatchedIndex() const { return m_lastDispatchedIndex; }
		bool isDispatchPending() const { return m_dispatchPending; }

	private:
		bool dispatch();
		void process(std::shared_ptr<const Frame> frame);
		void sinkLoop();

		const RingBuffer& m_ringBuffer;
		const TimingConfig& m_timingConfig;
		AbstractProcessingSink& m_sink;

		tbb::task_arena m_arena;
		std::unique_ptr<tbb::flow::graph> m_graph;
		std::unique_ptr<NodeTypeDiscarding> m_node;

		std::thread m_sinkThread;
		std::mutex m_sinkMutex;
		std::condition_variable m_sinkCondition;
		size_t m_numQueued;		// accepted by the node since the sink thread last ran the graph
		bool m_sinkActive;
		bool m_sinkThreadStop;

		std::atomic<DispatchPolicy> m_policy;
		ControlCallback m_controlCallback;
		bool m_dispatchPending;

		std::atomic<uint64_t> m_numDispatched;
		std::atomic<uint64_t> m_numSkipped;
		std::atomic<uint64_t> m_numRescheduled;
		std::atomic<uint64_t> m_numEmpty;
		std::atomic<uint64_t> m_numControlCheckpoints;
		std::atomic<uint64_t> m_numSinkErrors;
		std::atomic<uint64_t> m_lastDispatchedIndex;

		CallFrequency m_callFrequency;
	};
}

#endif //!__THROTTLEDDISPATCHER_H__
