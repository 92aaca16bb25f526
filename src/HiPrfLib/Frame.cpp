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

#include "Frame.h"

#include <stdexcept>
#include <utility>

namespace hiprf
{
	Frame::Frame(uint64_t acquisitionIndex, const FrameShape& shape, double timestamp, std::vector<SampleType>&& data)
		: m_acquisitionIndex(acquisitionIndex)
		, m_shape(shape)
		, m_timestamp(timestamp)
		, m_data(std::move(data))
	{
		if (m_data.size() != m_shape.getNumSamples())
		{
			throw std::invalid_argument("Frame: data size does not match the frame shape");
		}
	}

	const SampleType* Frame::getChannel(size_t channel) const
	{
		if (channel >= m_shape.numChannels)
		{
			throw std::out_of_range("Frame: channel index out of range");
		}
		return m_data.data() + channel * m_shape.numRows;
	}

	SampleType Frame::at(size_t row, size_t channel) const
	{
		if (row >= m_shape.numRows || channel >= m_shape.numChannels)
		{
			throw std::out_of_range("Frame: sample index out of range");
		}
		return m_data[channel * m_shape.numRows + row];
	}
}
