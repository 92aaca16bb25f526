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

#include "SimulatedTriggerSource.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "utilities/Logging.h"

using namespace std;

namespace hiprf
{
	namespace
	{
		const double c_pi = 3.14159265358979323846;
		// gaussian envelope width of the echo [wavelengths]
		const double c_pulseLength = 1.5;
	}

	constexpr SampleType SimulatedTriggerSource::c_echoAmplitude;
	constexpr uint64_t SimulatedTriggerSource::c_targetMotionPeriod;

	SimulatedTriggerSource::SimulatedTriggerSource(const AcquisitionGeometry& geometry, uint32_t rxElement, uint32_t latencyMicroseconds)
		: m_geometry(geometry)
		, m_rxElement(rxElement)
		, m_latency(latencyMicroseconds)
		, m_running(true)
		, m_armedIndex(0)
		, m_numFired(0)
		, m_numCompleted(0)
	{
		if (!m_geometry.isValid())
		{
			throw std::invalid_argument("SimulatedTriggerSource: invalid acquisition geometry");
		}
		if (m_rxElement >= m_geometry.frameShape.numChannels)
		{
			throw std::invalid_argument("SimulatedTriggerSource: rx element " + std::to_string(m_rxElement) +
				" outside of the " + std::to_string(m_geometry.frameShape.numChannels) + " channels");
		}

		m_payload.resize(m_geometry.frameShape.getNumSamples(), 0);
		m_thread = std::thread([this] { executionLoop(); });
		logging::log_log("SimulatedTriggerSource: ", m_geometry.frameShape.numRows, " x ", m_geometry.frameShape.numChannels,
			" samples, rx element ", m_rxElement, ", latency ", m_latency, " us");
	}

	SimulatedTriggerSource::~SimulatedTriggerSource()
	{
		{
			lock_guard<mutex> lock(m_objMutex);
			m_running = false;
		}
		m_pendingCondition.notify_all();
		if (m_thread.joinable())
		{
			m_thread.join();
		}
	}

	void SimulatedTriggerSource::setCompletionCallback(CompletionCallback callback)
	{
		lock_guard<mutex> lock(m_callbackMutex);
		m_callback = callback;
	}

	void SimulatedTriggerSource::arm(const SlotDescriptor& slot)
	{
		if (!(slot.shape == m_geometry.frameShape))
		{
			throw std::invalid_argument("SimulatedTriggerSource: armed with a slot of a different frame shape");
		}
		lock_guard<mutex> lock(m_objMutex);
		m_armedIndex = slot.acquisitionIndex;
	}

	void SimulatedTriggerSource::fire()
	{
		{
			lock_guard<mutex> lock(m_objMutex);
			if (m_armedIndex == 0)
			{
				logging::log_warn("SimulatedTriggerSource: fire() without arm(), ignored");
				return;
			}
			PendingAcquisition pending;
			pending.acquisitionIndex = m_armedIndex;
			pending.due = SingleThreadTimer::clock::now() + std::chrono::microseconds(m_latency);
			m_pending.push_back(pending);
			m_armedIndex = 0;
		}
		m_numFired++;
		m_pendingCondition.notify_one();
	}

	void SimulatedTriggerSource::injectFault(uint64_t acquisitionIndex, int faultCode)
	{
		lock_guard<mutex> lock(m_objMutex);
		m_injectedFaults[acquisitionIndex] = faultCode;
	}

	void SimulatedTriggerSource::injectTimeout(uint64_t acquisitionIndex)
	{
		lock_guard<mutex> lock(m_objMutex);
		m_injectedTimeouts.insert(acquisitionIndex);
	}

	double SimulatedTriggerSource::getTargetDepth(uint64_t acquisitionIndex) const
	{
		double center = 0.5 * (m_geometry.startDepth + m_geometry.endDepth);
		double amplitude = 0.25 * (m_geometry.endDepth - m_geometry.startDepth);
		double phase = 2.0 * c_pi * static_cast<double>(acquisitionIndex % c_targetMotionPeriod) / c_targetMotionPeriod;
		return center + amplitude * std::sin(phase);
	}

	void SimulatedTriggerSource::executionLoop()
	{
		while (m_running)
		{
			PendingAcquisition pending;
			bool fault = false;
			int faultCode = 0;
			bool dropped = false;
			{
				unique_lock<mutex> lock(m_objMutex);
				m_pendingCondition.wait(lock, [this] { return !m_running || !m_pending.empty(); });
				if (!m_running)
				{
					break;
				}
				pending = m_pending.front();
				m_pending.pop_front();

				auto faultIter = m_injectedFaults.find(pending.acquisitionIndex);
				if (faultIter != m_injectedFaults.end())
				{
					fault = true;
					faultCode = faultIter->second;
					m_injectedFaults.erase(faultIter);
				}
				auto timeoutIter = m_injectedTimeouts.find(pending.acquisitionIndex);
				if (timeoutIter != m_injectedTimeouts.end())
				{
					dropped = true;
					m_injectedTimeouts.erase(timeoutIter);
				}
			}

			SingleThreadTimer::waitUntil(pending.due);
			if (dropped)
			{
				logging::log_log("SimulatedTriggerSource: Dropped completion of acquisition ", pending.acquisitionIndex);
				continue;
			}

			AcquisitionCompletion completion;
			completion.acquisitionIndex = pending.acquisitionIndex;
			completion.fault = fault;
			completion.faultCode = faultCode;
			completion.payload = nullptr;
			completion.numSamples = 0;
			if (!fault)
			{
				synthesizeEcho(pending.acquisitionIndex);
				completion.payload = m_payload.data();
				completion.numSamples = m_payload.size();
			}
			complete(completion);
		}
	}

	void SimulatedTriggerSource::synthesizeEcho(uint64_t acquisitionIndex)
	{
		size_t numRows = m_geometry.frameShape.numRows;
		SampleType* channel = m_payload.data() + m_rxElement * numRows;
		std::fill(channel, channel + numRows, static_cast<SampleType>(0));

		double rowDepth = (m_geometry.endDepth - m_geometry.startDepth) / numRows;
		double targetDepth = getTargetDepth(acquisitionIndex);

		// only the rows within a few pulse lengths of the target carry signal
		double reach = 4.0 * c_pulseLength;
		double firstDepth = std::max(targetDepth - reach, m_geometry.startDepth);
		size_t firstRow = static_cast<size_t>((firstDepth - m_geometry.startDepth) / rowDepth);
		for (size_t row = firstRow; row < numRows; row++)
		{
			double distance = m_geometry.startDepth + row * rowDepth - targetDepth;
			if (distance > reach)
			{
				break;
			}
			double envelope = std::exp(-(distance / c_pulseLength) * (distance / c_pulseLength));
			// two way travel: two carrier periods per wavelength of depth
			double carrier = std::cos(2.0 * c_pi * 2.0 * distance);
			channel[row] = static_cast<SampleType>(std::round(c_echoAmplitude * envelope * carrier));
		}
	}

	void SimulatedTriggerSource::complete(const AcquisitionCompletion& completion)
	{
		lock_guard<mutex> lock(m_callbackMutex);
		m_numCompleted++;
		if (m_callback)
		{
			m_callback(completion);
		}
	}
}
