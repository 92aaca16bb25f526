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

#include "FrameInfoSink.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "utilities/Logging.h"

using namespace std;

namespace hiprf
{
	FrameInfoSink::FrameInfoSink(const std::string& prefix, uint32_t channel)
		: m_prefix(prefix)
		, m_channel(channel)
		, m_numFrames(0)
		, m_lastAcquisitionIndex(0)
		, m_lastPeak(0.0)
		, m_lastRms(0.0)
	{
	}

	void FrameInfoSink::setPrefix(const std::string& prefix)
	{
		// lock the object mutex to make sure no processing happens during parameter changes
		unique_lock<mutex> l(m_mutex);
		m_prefix = prefix;
	}

	void FrameInfoSink::setChannel(uint32_t channel)
	{
		unique_lock<mutex> l(m_mutex);
		m_channel = channel;
	}

	void FrameInfoSink::accept(std::shared_ptr<const Frame> frame)
	{
		if (!frame)
		{
			logging::log_error("FrameInfoSink: '", m_prefix, "' received no frame");
			return;
		}

		unique_lock<mutex> l(m_mutex);
		const FrameShape& shape = frame->getShape();
		if (m_channel >= shape.numChannels)
		{
			logging::log_error("FrameInfoSink: '", m_prefix, "' channel ", m_channel, " not present in a frame with ",
				shape.numChannels, " channels");
			return;
		}

		const SampleType* channel = frame->getChannel(m_channel);
		int peak = 0;
		double sumOfSquares = 0.0;
		for (size_t row = 0; row < shape.numRows; row++)
		{
			int sample = channel[row];
			peak = max(peak, abs(sample));
			sumOfSquares += static_cast<double>(sample) * sample;
		}
		double rms = sqrt(sumOfSquares / shape.numRows);

		m_lastPeak = peak;
		m_lastRms = rms;
		m_lastAcquisitionIndex = frame->getAcquisitionIndex();
		m_numFrames++;

		logging::log_info(m_prefix, ": acquisition ", frame->getAcquisitionIndex(), ", (", shape.numRows, ", ",
			shape.numChannels, "), channel ", m_channel, " peak ", peak, ", rms ", rms);
	}
}
