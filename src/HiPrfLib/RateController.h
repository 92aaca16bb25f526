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

#ifndef __RATECONTROLLER_H__
#define __RATECONTROLLER_H__

#include <atomic>
#include <cstdint>
#include <mutex>

#include "AcquisitionGeometry.h"
#include "AcquisitionStatus.h"
#include "TimingConfig.h"

namespace hiprf
{
	/// Inbound message from the supervisor
	struct RateRequest
	{
		uint32_t newPeriodMicroseconds;
	};

	/// Validates runtime timing changes and publishes them into the TimingConfig.
	/// The scheduler reads the period when a cycle begins, so a change never affects
	/// an acquisition that is already in flight.
	class RateController
	{
	public:
		RateController(TimingConfig& timingConfig, const AcquisitionGeometry& geometry);

		AcquisitionStatus setPeriod(uint32_t newPeriodMicroseconds);
		/// PRF in kHz, converted to the period round(1000 / kHz) us
		AcquisitionStatus setPulseRepetitionFrequency(double kiloHertz);
		AcquisitionStatus setCadences(uint32_t processingCadence, uint32_t controlCadence);
		AcquisitionStatus handleRequest(const RateRequest& request);

		uint32_t getMinimumPeriod() const { return m_minimumPeriod; }
		uint32_t getPeriod() const;
		const AcquisitionGeometry& getGeometry() const { return m_geometry; }

		uint64_t getNumAccepted() const { return m_numAccepted; }
		uint64_t getNumRejected() const { return m_numRejected; }

		static constexpr double c_minPulseRepetitionFrequency = 1.0;	// [kHz]
		static constexpr double c_maxPulseRepetitionFrequency = 50.0;	// [kHz]

	private:
		AcquisitionStatus reject(AcquisitionStatus status);

		TimingConfig& m_timingConfig;
		AcquisitionGeometry m_geometry;
		uint32_t m_minimumPeriod;

		// serializes writers, readers never take it
		std::mutex m_writerMutex;

		std::atomic<uint64_t> m_numAccepted;
		std::atomic<uint64_t> m_numRejected;
	};
}

#endif //!__RATECONTROLLER_H__
