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

#ifndef __FRAMEINFOSINK_H__
#define __FRAMEINFOSINK_H__

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "AbstractProcessingSink.h"

namespace hiprf
{
	/// Logs index, shape, peak and RMS of the monitored channel for every frame it receives
	class FrameInfoSink : public AbstractProcessingSink
	{
	public:
		FrameInfoSink(const std::string& prefix = "Frame", uint32_t channel = 0);

		virtual void accept(std::shared_ptr<const Frame> frame);

		void setPrefix(const std::string& prefix);
		void setChannel(uint32_t channel);

		uint64_t getNumFrames() const { return m_numFrames; }
		uint64_t getLastAcquisitionIndex() const { return m_lastAcquisitionIndex; }
		double getLastPeak() const { return m_lastPeak; }
		double getLastRms() const { return m_lastRms; }

	private:
		std::mutex m_mutex;

		std::string m_prefix;
		uint32_t m_channel;

		std::atomic<uint64_t> m_numFrames;
		std::atomic<uint64_t> m_lastAcquisitionIndex;
		std::atomic<double> m_lastPeak;
		std::atomic<double> m_lastRms;
	};
}

#endif //!__FRAMEINFOSINK_H__
