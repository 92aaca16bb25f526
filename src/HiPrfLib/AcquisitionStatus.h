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

#ifndef __ACQUISITIONSTATUS_H__
#define __ACQUISITIONSTATUS_H__

#include <ostream>
#include <stdexcept>
#include <string>

namespace hiprf
{
	enum class AcquisitionStatus
	{
		Ok,
		Stopped,
		HardwareFault,			// fatal, halts the scheduler
		AcquisitionTimeout,		// recoverable, one cycle is dropped
		PeriodTooShort,			// rejected rate change, previous period retained
		OverwriteInProgress,	// fatal, ring buffer too small for the producer/consumer mismatch
		InvalidParameter,		// rejected configuration change
		InternalError			// fatal, unexpected exception in the acquisition thread
	};

	const char* acquisitionStatusToString(AcquisitionStatus status);
	bool isFatal(AcquisitionStatus status);

	inline std::ostream& operator<<(std::ostream& os, AcquisitionStatus status)
	{
		return os << acquisitionStatusToString(status);
	}

	/// Raised inside the acquisition flow for fatal conditions
	class AcquisitionException : public std::runtime_error
	{
	public:
		AcquisitionException(AcquisitionStatus status, const std::string& message)
			: std::runtime_error(message)
			, m_status(status) {}

		AcquisitionStatus getStatus() const { return m_status; }

	private:
		AcquisitionStatus m_status;
	};
}

#endif //!__ACQUISITIONSTATUS_H__
