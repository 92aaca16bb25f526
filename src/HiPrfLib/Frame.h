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

#ifndef __FRAME_H__
#define __FRAME_H__

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hiprf
{
	typedef int16_t SampleType;

	struct FrameShape
	{
		size_t numRows;		// samples along depth
		size_t numChannels;	// receive channels

		size_t getNumSamples() const { return numRows * numChannels; }
	};

	inline bool operator==(const FrameShape& a, const FrameShape& b)
	{
		return a.numRows == b.numRows && a.numChannels == b.numChannels;
	}

	/// The sample block of one acquisition. Samples are stored channel by channel,
	/// i.e. the rows of one channel are contiguous.
	class Frame
	{
	public:
		Frame(uint64_t acquisitionIndex, const FrameShape& shape, double timestamp, std::vector<SampleType>&& data);

		uint64_t getAcquisitionIndex() const { return m_acquisitionIndex; }
		const FrameShape& getShape() const { return m_shape; }
		double getTimestamp() const { return m_timestamp; }

		const SampleType* get() const { return m_data.data(); }
		const SampleType* getChannel(size_t channel) const;
		size_t size() const { return m_data.size(); }
		SampleType at(size_t row, size_t channel) const;

	private:
		uint64_t m_acquisitionIndex;
		FrameShape m_shape;
		double m_timestamp;
		std::vector<SampleType> m_data;
	};
}

#endif //!__FRAME_H__
