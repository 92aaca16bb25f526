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

#ifndef __UTILITY_H__
#define __UTILITY_H__

#include <chrono>

namespace hiprf
{
	/// Returns the current wall time in seconds
	inline double getCurrentTime()
	{
		return std::chrono::duration_cast<std::chrono::duration<double> >(
			std::chrono::system_clock::now().time_since_epoch()).count();
	}
}

#endif //!__UTILITY_H__
