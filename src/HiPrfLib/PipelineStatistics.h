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

#ifndef __PIPELINESTATISTICS_H__
#define __PIPELINESTATISTICS_H__

#include <cstdint>
#include <ostream>

#include "AcquisitionStatus.h"

namespace hiprf
{
	/// Snapshot of the counters of one acquisition pipeline
	struct PipelineStatistics
	{
		// acquisition flow
		uint64_t numAcquisitions;
		uint64_t numTimeouts;
		uint64_t numLateCompletions;
		uint64_t numForcedResets;
		uint64_t numSnapshotRetries;
		uint64_t latestCompleteIndex;
		double measuredFrequency;	// [Hz]

		// processing and control flow
		uint64_t numDispatched;
		uint64_t numSkipped;
		uint64_t numRescheduled;
		uint64_t numEmpty;
		uint64_t numSinkErrors;
		uint64_t lastDispatchedIndex;
		uint64_t numControlCheckpoints;

		// rate control
		uint64_t numRateChangesAccepted;
		uint64_t numRateChangesRejected;
		uint32_t periodMicroseconds;
		uint32_t minimumPeriodMicroseconds;

		AcquisitionStatus terminalStatus;
	};

	inline std::ostream& operator<<(std::ostream& os, const PipelineStatistics& statistics)
	{
		os << "acquisitions: " << statistics.numAcquisitions
			<< " (latest " << statistics.latestCompleteIndex
			<< ", " << statistics.measuredFrequency << " Hz)"
			<< ", timeouts: " << statistics.numTimeouts
			<< ", late: " << statistics.numLateCompletions
			<< ", resets: " << statistics.numForcedResets
			<< ", snapshot retries: " << statistics.numSnapshotRetries
			<< ", dispatched: " << statistics.numDispatched
			<< " (last " << statistics.lastDispatchedIndex << ")"
			<< ", skipped: " << statistics.numSkipped
			<< ", rescheduled: " << statistics.numRescheduled
			<< ", empty: " << statistics.numEmpty
			<< ", sink errors: " << statistics.numSinkErrors
			<< ", checkpoints: " << statistics.numControlCheckpoints
			<< ", rate changes: " << statistics.numRateChangesAccepted
			<< " accepted / " << statistics.numRateChangesRejected << " rejected"
			<< ", period: " << statistics.periodMicroseconds
			<< " us (min " << statistics.minimumPeriodMicroseconds << " us)"
			<< ", status: " << statistics.terminalStatus;
		return os;
	}
}

#endif //!__PIPELINESTATISTICS_H__
