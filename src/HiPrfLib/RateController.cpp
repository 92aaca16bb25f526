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

#include "RateController.h"

#include <cmath>
#include <stdexcept>

#include "utilities/Logging.h"

namespace hiprf
{
	using logging::log_log;
	using logging::log_warn;

	constexpr double RateController::c_minPulseRepetitionFrequency;
	constexpr double RateController::c_maxPulseRepetitionFrequency;

	RateController::RateController(TimingConfig& timingConfig, const AcquisitionGeometry& geometry)
		: m_timingConfig(timingConfig)
		, m_geometry(geometry)
		, m_minimumPeriod(0)
		, m_numAccepted(0)
		, m_numRejected(0)
	{
		if (!m_geometry.isValid())
		{
			throw std::invalid_argument("RateController: invalid acquisition geometry");
		}
		m_minimumPeriod = m_geometry.getMinimumPeriod();
		log_log("RateController: minimum period ", m_minimumPeriod, " us (round trip ", m_geometry.getRoundTripTime(),
			" us, transfer ", m_geometry.getTransferTime(), " us, setup ", m_geometry.setupOverhead, " us)");
	}

	AcquisitionStatus RateController::setPeriod(uint32_t newPeriodMicroseconds)
	{
		if (newPeriodMicroseconds < m_minimumPeriod)
		{
			log_warn("RateController: Rejected period of ", newPeriodMicroseconds, " us, the minimum is ",
				m_minimumPeriod, " us");
			return reject(AcquisitionStatus::PeriodTooShort);
		}

		std::lock_guard<std::mutex> lock(m_writerMutex);
		TimingParameters parameters = m_timingConfig.get();
		parameters.periodMicroseconds = newPeriodMicroseconds;
		m_timingConfig.publish(parameters);
		m_numAccepted++;
		log_log("RateController: New period ", newPeriodMicroseconds, " us (", 1000.0 / newPeriodMicroseconds, " kHz)");
		return AcquisitionStatus::Ok;
	}

	AcquisitionStatus RateController::setPulseRepetitionFrequency(double kiloHertz)
	{
		if (!(kiloHertz >= c_minPulseRepetitionFrequency && kiloHertz <= c_maxPulseRepetitionFrequency))
		{
			log_warn("RateController: Rejected PRF of ", kiloHertz, " kHz, allowed are ",
				c_minPulseRepetitionFrequency, " to ", c_maxPulseRepetitionFrequency, " kHz");
			return reject(AcquisitionStatus::InvalidParameter);
		}
		return setPeriod(static_cast<uint32_t>(std::round(1000.0 / kiloHertz)));
	}

	AcquisitionStatus RateController::setCadences(uint32_t processingCadence, uint32_t controlCadence)
	{
		if (processingCadence == 0 || controlCadence == 0)
		{
			log_warn("RateController: Rejected cadences ", processingCadence, " / ", controlCadence,
				", both have to be at least 1");
			return reject(AcquisitionStatus::InvalidParameter);
		}

		std::lock_guard<std::mutex> lock(m_writerMutex);
		TimingParameters parameters = m_timingConfig.get();
		parameters.processingCadence = processingCadence;
		parameters.controlCadence = controlCadence;
		m_timingConfig.publish(parameters);
		m_numAccepted++;
		log_log("RateController: New cadences, processing every ", processingCadence,
			", control every ", controlCadence, " acquisitions");
		return AcquisitionStatus::Ok;
	}

	AcquisitionStatus RateController::handleRequest(const RateRequest& request)
	{
		return setPeriod(request.newPeriodMicroseconds);
	}

	uint32_t RateController::getPeriod() const
	{
		return m_timingConfig.get().periodMicroseconds;
	}

	AcquisitionStatus RateController::reject(AcquisitionStatus status)
	{
		m_numRejected++;
		return status;
	}
}
