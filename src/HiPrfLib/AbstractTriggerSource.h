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

#ifndef __ABSTRACTTRIGGERSOURCE_H__
#define __ABSTRACTTRIGGERSOURCE_H__

#include <cstdint>
#include <functional>

#include "Frame.h"

namespace hiprf
{
	/// Destination of one acquisition
	struct SlotDescriptor
	{
		uint64_t acquisitionIndex;
		size_t slotNumber;
		SampleType* destination;
		FrameShape shape;
	};

	struct AcquisitionCompletion
	{
		uint64_t acquisitionIndex;
		bool fault;
		int faultCode;
		// Only valid during the completion callback. nullptr if the source has written
		// the samples to the slot destination itself.
		const SampleType* payload;
		size_t numSamples;
	};

	/// The sensor front-end. Once armed and fired, it deposits one sample block
	/// and reports completion asynchronously.
	class AbstractTriggerSource
	{
	public:
		typedef std::function<void(const AcquisitionCompletion&)> CompletionCallback;

		virtual ~AbstractTriggerSource() {}

		//Needs to be thread safe, an empty callback detaches the receiver
		virtual void setCompletionCallback(CompletionCallback callback) = 0;
		virtual void arm(const SlotDescriptor& slot) = 0;
		virtual void fire() = 0;
	};
}

#endif //!__ABSTRACTTRIGGERSOURCE_H__
