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

#ifndef __TIMINGCONFIG_H__
#define __TIMINGCONFIG_H__

#include <atomic>
#include <cstdint>
#include <memory>

namespace hiprf
{
	struct TimingParameters
	{
		uint32_t periodMicroseconds;	// time between the starts of two acquisitions
		uint32_t processingCadence;		// acquisitions per dispatch to processing
		uint32_t controlCadence;		// acquisitions per control checkpoint
	};

	/// The timing parameters shared between the rate controller (writer) and the
	/// acquisition flow (readers). Every update replaces the complete parameter set at once,
	/// readers always see either the old or the new set.
	class TimingConfig
	{
	public:
		TimingConfig(const TimingParameters& initialParameters);

		TimingParameters get() const;
		void publish(const TimingParameters& parameters);
		/// Number of publications since construction
		uint64_t getVersion() const { return m_version; }

	private:
		std::shared_ptr<const TimingParameters> m_parameters;
		std::atomic<uint64_t> m_version;
	};
}

#endif //!__TIMINGCONFIG_H__
