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

#include "AcquisitionStatus.h"

namespace hiprf
{
	const char* acquisitionStatusToString(AcquisitionStatus status)
	{
		switch (status)
		{
		case AcquisitionStatus::Ok:
			return "Ok";
		case AcquisitionStatus::Stopped:
			return "Stopped";
		case AcquisitionStatus::HardwareFault:
			return "HardwareFault";
		case AcquisitionStatus::AcquisitionTimeout:
			return "AcquisitionTimeout";
		case AcquisitionStatus::PeriodTooShort:
			return "PeriodTooShort";
		case AcquisitionStatus::OverwriteInProgress:
			return "OverwriteInProgress";
		case AcquisitionStatus::InvalidParameter:
			return "InvalidParameter";
		case AcquisitionStatus::InternalError:
			return "InternalError";
		}
		return "Unknown";
	}

	bool isFatal(AcquisitionStatus status)
	{
		return status == AcquisitionStatus::HardwareFault ||
			status == AcquisitionStatus::OverwriteInProgress ||
			status == AcquisitionStatus::InternalError;
	}
}
