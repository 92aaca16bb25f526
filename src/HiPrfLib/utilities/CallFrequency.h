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

#ifndef __CALLFREQUENCY_H__
#define __CALLFREQUENCY_H__

#include <atomic>
#include <cstdint>
#include <string>

namespace hiprf
{
	/// Measures how often an activity is called and how long it runs.
	/// measure() and measureEnd() must be called from one thread, the getters are thread safe.
	/// The results are reported through logging::log_profiling every report interval.
	class CallFrequency
	{
	public:
		CallFrequency(const std::string& name = "", double reportIntervalSeconds = 5.0);

		void setName(const std::string& name);
		void setReportInterval(double reportIntervalSeconds);

		void measure();
		void measureEnd();

		double getFrequency() const { return m_frequency; }
		double getRunTime() const { return m_runTime; }
		uint64_t getNumCalls() const { return m_numCalls; }

	private:
		void report(double now);

		std::string m_name;
		double m_reportInterval;

		bool m_initialized;
		double m_lastCall;
		double m_lastReport;
		uint64_t m_callsSinceReport;

		std::atomic<double> m_frequency;
		std::atomic<double> m_runTime;
		std::atomic<uint64_t> m_numCalls;
	};
}

#endif //!__CALLFREQUENCY_H__
