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

#ifndef __SINGLETHREADTIMER_H__
#define __SINGLETHREADTIMER_H__

#include <chrono>
#include <cstdint>

namespace hiprf
{
	/// Paces a loop on a single thread. Each slot starts one period after the previous slot.
	/// The last part of every wait is spent spinning, as the OS sleep granularity is too
	/// coarse for periods of a few tens of microseconds.
	class SingleThreadTimer
	{
	public:
		typedef std::chrono::steady_clock clock;

		SingleThreadTimer();

		/// Starts counting slots from now
		void reset();
		/// Waits until lastSlot + period and returns that instant.
		/// If the slot was missed by more than a full period, the timer resynchronizes to now.
		clock::time_point sleepUntilNextSlot(uint32_t periodMicroseconds);
		clock::time_point getLastSlot() const { return m_lastSlot; }
		uint64_t getNumResynchronizations() const { return m_numResynchronizations; }

		static void waitUntil(clock::time_point target);

	private:
		static constexpr int64_t c_spinThresholdMicroseconds = 200;

		clock::time_point m_lastSlot;
		uint64_t m_numResynchronizations;
	};
}

#endif //!__SINGLETHREADTIMER_H__
