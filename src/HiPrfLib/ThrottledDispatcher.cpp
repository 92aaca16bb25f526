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

#include "ThrottledDispatcher.h"

#include "utilities/Logging.h"

using namespace std;

namespace hiprf
{
	const char* dispatchPolicyToString(DispatchPolicy policy)
	{
		switch (policy)
		{
		case DispatchPolicy::SkipWhenBusy:
			return "skip";
		case DispatchPolicy::StrictCadence:
			return "strict";
		}
		return "unknown";
	}

	bool dispatchPolicyFromString(const std::string& name, DispatchPolicy& policy)
	{
		if (name == "skip")
		{
			policy = DispatchPolicy::SkipWhenBusy;
			return true;
		}
		if (name == "strict")
		{
			policy = DispatchPolicy::StrictCadence;
			return true;
		}
		return false;
	}

	ThrottledDispatcher::ThrottledDispatcher(const RingBuffer& ringBuffer, const TimingConfig& timingConfig,
		AbstractProcessingSink& sink, DispatchPolicy policy)
		: m_ringBuffer(ringBuffer)
		, m_timingConfig(timingConfig)
		, m_sink(sink)
		, m_arena(2, 1)
		, m_numQueued(0)
		, m_sinkActive(false)
		, m_sinkThreadStop(false)
		, m_policy(policy)
		, m_dispatchPending(false)
		, m_numDispatched(0)
		, m_numSkipped(0)
		, m_numRescheduled(0)
		, m_numEmpty(0)
		, m_numControlCheckpoints(0)
		, m_numSinkErrors(0)
		, m_lastDispatchedIndex(0)
		, m_callFrequency("ProcessingSink")
	{
		// a graph created inside the arena attaches to it, the sink thread owns the reserved slot
		m_arena.execute([this] {
			m_graph = unique_ptr<tbb::flow::graph>(new tbb::flow::graph());
		});

		// concurrency 1 and rejecting: try_put fails instead of queueing while the sink is busy
		m_node = unique_ptr<NodeTypeDiscarding>(
			new NodeTypeDiscarding(*m_graph, 1, [this](shared_ptr<const Frame> frame) -> tbb::flow::continue_msg {
				process(frame);
				return tbb::flow::continue_msg();
		}));

		m_sinkThread = thread(&ThrottledDispatcher::sinkLoop, this);
	}

	ThrottledDispatcher::~ThrottledDispatcher()
	{
		{
			lock_guard<mutex> lock(m_sinkMutex);
			m_sinkThreadStop = true;
		}
		m_sinkCondition.notify_all();
		if (m_sinkThread.joinable())
		{
			m_sinkThread.join();
		}
	}

	void ThrottledDispatcher::setControlCallback(ControlCallback callback)
	{
		m_controlCallback = callback;
	}

	void ThrottledDispatcher::onAcquisition(uint64_t acquisitionCounter)
	{
		TimingParameters timing = m_timingConfig.get();

		if (isDispatchPoint(acquisitionCounter, timing.processingCadence) || m_dispatchPending)
		{
			bool handled = dispatch();
			if (handled)
			{
				m_dispatchPending = false;
			}
			else if (m_policy == DispatchPolicy::StrictCadence)
			{
				if (!m_dispatchPending)
				{
					m_numRescheduled++;
				}
				m_dispatchPending = true;
			}
			else
			{
				m_numSkipped++;
				m_dispatchPending = false;
			}
		}

		if (isControlPoint(acquisitionCounter, timing.controlCadence))
		{
			m_numControlCheckpoints++;
			if (m_controlCallback)
			{
				m_controlCallback(acquisitionCounter);
			}
		}
	}

	void ThrottledDispatcher::waitForSink()
	{
		unique_lock<mutex> lock(m_sinkMutex);
		m_sinkCondition.wait(lock, [this] { return m_numQueued == 0 && !m_sinkActive; });
	}

	void ThrottledDispatcher::sinkLoop()
	{
		unique_lock<mutex> lock(m_sinkMutex);
		while (true)
		{
			m_sinkCondition.wait(lock, [this] { return m_numQueued > 0 || m_sinkThreadStop; });
			if (m_numQueued == 0)
			{
				break;
			}
			m_numQueued = 0;
			m_sinkActive = true;
			lock.unlock();

			// runs the queued sink task, returns once the node accepts frames again
			m_graph->wait_for_all();

			lock.lock();
			m_sinkActive = false;
			m_sinkCondition.notify_all();
		}
	}

	bool ThrottledDispatcher::dispatch()
	{
		shared_ptr<const Frame> frame = m_ringBuffer.readLatestComplete();
		if (!frame)
		{
			m_numEmpty++;
			return true;
		}

		if (!m_node->try_put(frame))
		{
			return false;
		}
		{
			lock_guard<mutex> lock(m_sinkMutex);
			m_numQueued++;
		}
		m_sinkCondition.notify_all();
		m_numDispatched++;
		m_lastDispatchedIndex = frame->getAcquisitionIndex();
		return true;
	}

	void ThrottledDispatcher::process(shared_ptr<const Frame> frame)
	{
		m_callFrequency.measure();
		try
		{
			m_sink.accept(frame);
		}
		catch (const std::exception& e)
		{
			m_numSinkErrors++;
			logging::log_error("ThrottledDispatcher: Processing sink failed on acquisition ",
				frame->getAcquisitionIndex(), ": ", e.what());
		}
		m_callFrequency.measureEnd();
	}
}
