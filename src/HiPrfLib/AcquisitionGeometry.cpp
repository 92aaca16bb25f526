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

#include "AcquisitionGeometry.h"

#include <cmath>

namespace hiprf
{
	bool AcquisitionGeometry::isValid() const
	{
		return startDepth >= 0.0 &&
			endDepth > startDepth &&
			centerFrequency > 0.0 &&
			speedOfSound > 0.0 &&
			frameShape.getNumSamples() > 0 &&
			transferRate > 0.0 &&
			setupOverhead >= 0.0;
	}

	double AcquisitionGeometry::getWavelength() const
	{
		return speedOfSound / (centerFrequency * 1e3);
	}

	double AcquisitionGeometry::getRoundTripTime() const
	{
		// depth in wavelengths: one wavelength takes one period of the center frequency
		return 2.0 * endDepth / centerFrequency;
	}

	double AcquisitionGeometry::getTransferTime() const
	{
		return static_cast<double>(frameShape.getNumSamples() * sizeof(SampleType)) / transferRate;
	}

	uint32_t AcquisitionGeometry::getMinimumPeriod() const
	{
		return static_cast<uint32_t>(std::ceil(getRoundTripTime() + getTransferTime() + setupOverhead));
	}
}
