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

#ifndef __ACQUISITIONGEOMETRY_H__
#define __ACQUISITIONGEOMETRY_H__

#include <cstdint>

#include "Frame.h"

namespace hiprf
{
	/// The acquisition settings that bound how fast acquisitions can follow each other
	struct AcquisitionGeometry
	{
		double startDepth;			// [wavelengths]
		double endDepth;			// [wavelengths]
		double centerFrequency;		// [MHz]
		double speedOfSound;		// [m/s]
		FrameShape frameShape;
		double transferRate;		// host transfer [bytes/us]
		double setupOverhead;		// per acquisition [us]

		bool isValid() const;

		double getWavelength() const;		// [mm]
		double getRoundTripTime() const;	// [us]
		double getTransferTime() const;		// [us]
		/// Shortest period the hardware can sustain: round trip + transfer + setup,
		/// rounded up to whole microseconds
		uint32_t getMinimumPeriod() const;
	};
}

#endif //!__ACQUISITIONGEOMETRY_H__
