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

#include "TimingConfig.h"

namespace hiprf
{
	TimingConfig::TimingConfig(const TimingParameters& initialParameters)
		: m_parameters(std::make_shared<TimingParameters>(initialParameters))
		, m_version(0)
	{
	}

	TimingParameters TimingConfig::get() const
	{
		std::shared_ptr<const TimingParameters> parameters = std::atomic_load(&m_parameters);
		return *parameters;
	}

	void TimingConfig::publish(const TimingParameters& parameters)
	{
		std::shared_ptr<const TimingParameters> newParameters = std::make_shared<TimingParameters>(parameters);
		std::atomic_store(&m_parameters, newParameters);
		m_version++;
	}
}
