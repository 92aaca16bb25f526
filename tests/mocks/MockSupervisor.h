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

#ifndef __MOCKSUPERVISOR_H__
#define __MOCKSUPERVISOR_H__

#include <cstdint>

#include <gmock/gmock.h>

#include "AbstractSupervisor.h"

namespace hiprf
{
	namespace mocks
	{
		class MockSupervisor : public AbstractSupervisor
		{
		public:
			MOCK_METHOD(void, controlCheckpoint, (uint64_t acquisitionCounter), (override));
			MOCK_METHOD(void, acquisitionTerminated, (AcquisitionStatus status), (override));
		};
	}
}

#endif //!__MOCKSUPERVISOR_H__
