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

#ifndef __ABSTRACTPROCESSINGSINK_H__
#define __ABSTRACTPROCESSINGSINK_H__

#include <memory>

#include "Frame.h"

namespace hiprf
{
	/// Consumer of dispatched frames. accept() is never called concurrently with itself.
	class AbstractProcessingSink
	{
	public:
		virtual ~AbstractProcessingSink() {}

		virtual void accept(std::shared_ptr<const Frame> frame) = 0;
	};
}

#endif //!__ABSTRACTPROCESSINGSINK_H__
