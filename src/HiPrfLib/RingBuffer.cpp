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

#include "RingBuffer.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "AcquisitionStatus.h"

namespace hiprf
{
	WritableSlot::WritableSlot()
		: m_slotNumber(0)
		, m_acquisitionIndex(0)
		, m_data(nullptr)
		, m_size(0)
	{
	}

	WritableSlot::WritableSlot(size_t slotNumber, uint64_t acquisitionIndex, SampleType* data, size_t size)
		: m_slotNumber(slotNumber)
		, m_acquisitionIndex(acquisitionIndex)
		, m_data(data)
		, m_size(size)
	{
	}

	WritableSlot::WritableSlot(WritableSlot&& other)
		: m_slotNumber(other.m_slotNumber)
		, m_acquisitionIndex(other.m_acquisitionIndex)
		, m_data(other.m_data)
		, m_size(other.m_size)
	{
		other.m_data = nullptr;
		other.m_size = 0;
	}

	WritableSlot& WritableSlot::operator=(WritableSlot&& other)
	{
		m_slotNumber = other.m_slotNumber;
		m_acquisitionIndex = other.m_acquisitionIndex;
		m_data = other.m_data;
		m_size = other.m_size;
		other.m_data = nullptr;
		other.m_size = 0;
		return *this;
	}

	constexpr size_t RingBuffer::c_maxSnapshotAttempts;

	RingBuffer::Slot::Slot()
		: sequence(0)
		, acquisitionIndex(0)
		, timestamp(0.0)
		, state(SlotState::Empty)
	{
	}

	RingBuffer::RingBuffer(size_t capacity, const FrameShape& shape)
		: m_capacity(capacity)
		, m_shape(shape)
		, m_latestIndex(0)
		, m_numSnapshotRetries(0)
	{
		if (m_capacity == 0)
		{
			throw std::invalid_argument("RingBuffer: capacity must be at least 1");
		}
		if (m_shape.getNumSamples() == 0)
		{
			throw std::invalid_argument("RingBuffer: frame shape must not be empty");
		}

		m_slots = std::unique_ptr<Slot[]>(new Slot[m_capacity]);
		for (size_t slotNumber = 0; slotNumber < m_capacity; slotNumber++)
		{
			m_slots[slotNumber].data.resize(m_shape.getNumSamples(), 0);
		}
	}

	WritableSlot RingBuffer::write(uint64_t acquisitionIndex)
	{
		if (acquisitionIndex == 0)
		{
			throw std::invalid_argument("RingBuffer: acquisition indices start at 1");
		}

		size_t slotNumber = getSlotNumber(acquisitionIndex);
		Slot& slot = m_slots[slotNumber];
		if (slot.state.load(std::memory_order_relaxed) == SlotState::Writing)
		{
			throw AcquisitionException(AcquisitionStatus::OverwriteInProgress,
				"RingBuffer: slot " + std::to_string(slotNumber) + " is still being written by acquisition " +
				std::to_string(slot.acquisitionIndex.load()) + ", cannot start acquisition " +
				std::to_string(acquisitionIndex));
		}

		// odd sequence: readers discard whatever they copy from now on
		uint64_t sequence = slot.sequence.load(std::memory_order_relaxed);
		slot.sequence.store(sequence + 1, std::memory_order_relaxed);
		std::atomic_thread_fence(std::memory_order_release);
		slot.state.store(SlotState::Writing, std::memory_order_relaxed);
		slot.acquisitionIndex.store(acquisitionIndex, std::memory_order_relaxed);

		return WritableSlot(slotNumber, acquisitionIndex, slot.data.data(), slot.data.size());
	}

	void RingBuffer::commit(WritableSlot& writable, double timestamp)
	{
		if (!writable.isValid())
		{
			throw std::logic_error("RingBuffer: commit of an invalid slot");
		}

		Slot& slot = m_slots[writable.m_slotNumber];
		if (slot.state.load(std::memory_order_relaxed) != SlotState::Writing ||
			slot.acquisitionIndex.load(std::memory_order_relaxed) != writable.m_acquisitionIndex)
		{
			throw std::logic_error("RingBuffer: slot " + std::to_string(writable.m_slotNumber) +
				" is not being written by acquisition " + std::to_string(writable.m_acquisitionIndex));
		}

		slot.timestamp.store(timestamp, std::memory_order_relaxed);
		slot.state.store(SlotState::Complete, std::memory_order_relaxed);
		uint64_t sequence = slot.sequence.load(std::memory_order_relaxed);
		slot.sequence.store(sequence + 1, std::memory_order_release);

		if (writable.m_acquisitionIndex > m_latestIndex.load(std::memory_order_relaxed))
		{
			m_latestIndex.store(writable.m_acquisitionIndex, std::memory_order_release);
		}
		writable = WritableSlot();
	}

	void RingBuffer::forceReset(uint64_t acquisitionIndex)
	{
		Slot& slot = m_slots[getSlotNumber(acquisitionIndex)];
		if (slot.state.load(std::memory_order_relaxed) != SlotState::Writing)
		{
			return;
		}
		slot.state.store(SlotState::Empty, std::memory_order_relaxed);
		slot.acquisitionIndex.store(0, std::memory_order_relaxed);
		uint64_t sequence = slot.sequence.load(std::memory_order_relaxed);
		slot.sequence.store(sequence + 1, std::memory_order_release);
	}

	RingBuffer::SnapshotResult RingBuffer::trySnapshot(uint64_t acquisitionIndex, std::shared_ptr<const Frame>& frame) const
	{
		const Slot& slot = m_slots[getSlotNumber(acquisitionIndex)];

		uint64_t sequenceBefore = slot.sequence.load(std::memory_order_acquire);
		if (sequenceBefore & 1)
		{
			return SnapshotResult::Busy;
		}
		if (slot.state.load(std::memory_order_relaxed) != SlotState::Complete ||
			slot.acquisitionIndex.load(std::memory_order_relaxed) != acquisitionIndex)
		{
			return SnapshotResult::Missing;
		}

		std::vector<SampleType> payload(slot.data.begin(), slot.data.end());
		double timestamp = slot.timestamp.load(std::memory_order_relaxed);

		std::atomic_thread_fence(std::memory_order_acquire);
		uint64_t sequenceAfter = slot.sequence.load(std::memory_order_relaxed);
		if (sequenceAfter != sequenceBefore)
		{
			return SnapshotResult::Busy;
		}

		frame = std::make_shared<Frame>(acquisitionIndex, m_shape, timestamp, std::move(payload));
		return SnapshotResult::Success;
	}

	std::shared_ptr<const Frame> RingBuffer::readLatestComplete() const
	{
		std::shared_ptr<const Frame> frame;
		for (size_t attempt = 0; attempt < c_maxSnapshotAttempts; attempt++)
		{
			uint64_t latest = m_latestIndex.load(std::memory_order_acquire);
			if (latest == 0)
			{
				return nullptr;
			}

			// newest first, older complete slots are an acceptable fallback
			uint64_t depth = std::min<uint64_t>(m_capacity, latest);
			for (uint64_t candidate = latest; candidate > latest - depth; candidate--)
			{
				if (trySnapshot(candidate, frame) == SnapshotResult::Success)
				{
					return frame;
				}
			}
			m_numSnapshotRetries++;
		}
		return nullptr;
	}

	std::shared_ptr<const Frame> RingBuffer::readComplete(uint64_t acquisitionIndex) const
	{
		std::shared_ptr<const Frame> frame;
		for (size_t attempt = 0; attempt < c_maxSnapshotAttempts; attempt++)
		{
			uint64_t latest = m_latestIndex.load(std::memory_order_acquire);
			if (acquisitionIndex == 0 || acquisitionIndex > latest || latest - acquisitionIndex >= m_capacity)
			{
				return nullptr;
			}

			SnapshotResult result = trySnapshot(acquisitionIndex, frame);
			if (result == SnapshotResult::Success)
			{
				return frame;
			}
			if (result == SnapshotResult::Missing)
			{
				return nullptr;
			}
			m_numSnapshotRetries++;
		}
		return nullptr;
	}

	SlotState RingBuffer::getSlotState(size_t slotNumber) const
	{
		if (slotNumber >= m_capacity)
		{
			throw std::out_of_range("RingBuffer: slot number out of range");
		}
		return m_slots[slotNumber].state.load(std::memory_order_acquire);
	}

	uint64_t RingBuffer::getSlotAcquisitionIndex(size_t slotNumber) const
	{
		if (slotNumber >= m_capacity)
		{
			throw std::out_of_range("RingBuffer: slot number out of range");
		}
		return m_slots[slotNumber].acquisitionIndex.load(std::memory_order_acquire);
	}
}
