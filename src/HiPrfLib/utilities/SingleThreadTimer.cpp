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

#include "SingleThreadTimer.h"

#include <thread>

namespace hiprf
{
	constexpr int64_t SingleThreadTimer::c_spinThresholdMicroseconds;

	SingleThreadTimer::SingleThreadTimer()
		: m_lastSlot(clock::now())
		, m_numResynchronizations(0)
	{
	}

	void SingleThreadTimer::reset()
	{
		m_lastSlot = clock::now();
	}

	SingleThreadTimer::clock::time_point SingleThreadTimer::sleepUntilNextSlot(uint32_t periodMicroseconds)
	{
		auto period = std::chrono::microseconds(periodMicroseconds);
		auto target = m_lastSlot + period;
		auto now = clock::now();
		if (now > target + period)
		{
			// we are too late to keep the grid, start a new one
			m_numResynchronizations++;
			target = now;
		}
		else
		{
			waitUntil(target);
		}
		m_lastSlot = target;
		return target;
	}

	void SingleThreadTimer::waitUntil(clock::time_point target)
	{
		auto spinStart = target - std::chrono::microseconds(c_spinThresholdMicroseconds);
		if (clock::now() < spinStart)
		{
			std::this_thread::sleep_until(spinStart);
		}
		while (clock::now() < target)
		{
			std::this_thread::yield();
		}
	}
}
