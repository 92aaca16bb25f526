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

#ifndef __ABSTRACTSUPERVISOR_H__
#define __ABSTRACTSUPERVISOR_H__

#include <cstdint>

#include "AcquisitionStatus.h"

namespace hiprf
{
	/// The control loop the acquisition flow hands control to
	class AbstractSupervisor
	{
	public:
		virtual ~AbstractSupervisor() {}

		/// Called on the acquisition thread at the control cadence. Has to return quickly,
		/// the next acquisition is only scheduled afterwards.
		virtual void controlCheckpoint(uint64_t acquisitionCounter) = 0;
		/// Called once when the acquisition flow has ended
		virtual void acquisitionTerminated(AcquisitionStatus status) = 0;
	};
}

#endif //!__ABSTRACTSUPERVISOR_H__
