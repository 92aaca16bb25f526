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

#include "CallFrequency.h"

#include <chrono>

#include "Logging.h"

namespace hiprf
{
	namespace
	{
		double getMonotonicTime()
		{
			return std::chrono::duration_cast<std::chrono::duration<double> >(
				std::chrono::steady_clock::now().time_since_epoch()).count();
		}
	}

	CallFrequency::CallFrequency(const std::string& name, double reportIntervalSeconds)
		: m_name(name)
		, m_reportInterval(reportIntervalSeconds)
		, m_initialized(false)
		, m_lastCall(0.0)
		, m_lastReport(0.0)
		, m_callsSinceReport(0)
		, m_frequency(0.0)
		, m_runTime(0.0)
		, m_numCalls(0)
	{
	}

	void CallFrequency::setName(const std::string& name)
	{
		m_name = name;
	}

	void CallFrequency::setReportInterval(double reportIntervalSeconds)
	{
		m_reportInterval = reportIntervalSeconds;
	}

	void CallFrequency::measure()
	{
		double now = getMonotonicTime();
		m_numCalls++;
		if (!m_initialized)
		{
			m_initialized = true;
			m_lastReport = now;
			m_callsSinceReport = 0;
		}
		else
		{
			m_callsSinceReport++;
		}
		m_lastCall = now;

		if (now - m_lastReport >= m_reportInterval)
		{
			report(now);
		}
	}

	void CallFrequency::measureEnd()
	{
		if (m_initialized)
		{
			m_runTime = getMonotonicTime() - m_lastCall;
		}
	}

	void CallFrequency::report(double now)
	{
		double elapsed = now - m_lastReport;
		if (elapsed > 0)
		{
			m_frequency = static_cast<double>(m_callsSinceReport) / elapsed;
		}
		logging::log_profiling(m_name, ": ", m_frequency.load(), " Hz, run time ", m_runTime.load() * 1e6, " us, ",
			m_numCalls.load(), " calls");
		m_lastReport = now;
		m_callsSinceReport = 0;
	}
}
