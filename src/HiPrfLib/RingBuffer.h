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

#ifndef __RINGBUFFER_H__
#define __RINGBUFFER_H__

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "Frame.h"

namespace hiprf
{
	enum class SlotState : uint8_t
	{
		Empty,
		Writing,
		Complete
	};

	class RingBuffer;

	/// Exclusive write access to one ring buffer slot, obtained with RingBuffer::write
	/// and given back with RingBuffer::commit
	class WritableSlot
	{
	public:
		WritableSlot();
		WritableSlot(WritableSlot&& other);
		WritableSlot& operator=(WritableSlot&& other);

		bool isValid() const { return m_data != nullptr; }
		uint64_t getAcquisitionIndex() const { return m_acquisitionIndex; }
		size_t getSlotNumber() const { return m_slotNumber; }
		SampleType* get() { return m_data; }
		size_t size() const { return m_size; }

	private:
		friend class RingBuffer;
		WritableSlot(size_t slotNumber, uint64_t acquisitionIndex, SampleType* data, size_t size);
		WritableSlot(const WritableSlot&) = delete;
		WritableSlot& operator=(const WritableSlot&) = delete;

		size_t m_slotNumber;
		uint64_t m_acquisitionIndex;
		SampleType* m_data;
		size_t m_size;
	};

	/// Fixed-capacity circular store of frame slots with a single writer and any number of readers.
	///
	/// Acquisition indices start at 1. Slot k holds the frame whose acquisition index
	/// modulo the capacity is k. Slots are allocated once and overwritten on wraparound,
	/// so a reader that falls behind by more than the capacity loses frames.
	///
	/// Readers never lock. Each slot carries a sequence counter that is odd while the slot
	/// is written; a reader copies the payload and only accepts the copy if the counter did
	/// not change in the meantime.
	class RingBuffer
	{
	public:
		RingBuffer(size_t capacity, const FrameShape& shape);

		/// Throws AcquisitionException(OverwriteInProgress) if the slot for this index is still
		/// being written
		WritableSlot write(uint64_t acquisitionIndex);
		/// Publishes the slot for readers. The slot handle is invalid afterwards.
		void commit(WritableSlot& slot, double timestamp);
		/// Returns a slot that was left in the Writing state to Empty. Producer only.
		void forceReset(uint64_t acquisitionIndex);

		/// Never blocks. Returns the most recently committed frame, or an older complete frame if
		/// the newest slot is being overwritten. nullptr if nothing was committed yet.
		std::shared_ptr<const Frame> readLatestComplete() const;
		/// nullptr if the index was never committed or has already been overwritten
		std::shared_ptr<const Frame> readComplete(uint64_t acquisitionIndex) const;

		size_t getCapacity() const { return m_capacity; }
		const FrameShape& getShape() const { return m_shape; }
		size_t getSlotNumber(uint64_t acquisitionIndex) const { return static_cast<size_t>(acquisitionIndex % m_capacity); }
		uint64_t getLatestCompleteIndex() const { return m_latestIndex.load(std::memory_order_acquire); }
		SlotState getSlotState(size_t slotNumber) const;
		uint64_t getSlotAcquisitionIndex(size_t slotNumber) const;
		uint64_t getNumSnapshotRetries() const { return m_numSnapshotRetries; }

	private:
		struct Slot
		{
			Slot();

			std::atomic<uint64_t> sequence;
			std::atomic<uint64_t> acquisitionIndex;
			std::atomic<double> timestamp;
			std::atomic<SlotState> state;
			std::vector<SampleType> data;
		};

		enum class SnapshotResult
		{
			Success,
			Busy,		// the slot is being written, retrying can succeed
			Missing		// the slot holds another acquisition
		};

		SnapshotResult trySnapshot(uint64_t acquisitionIndex, std::shared_ptr<const Frame>& frame) const;

		static constexpr size_t c_maxSnapshotAttempts = 16;

		size_t m_capacity;
		FrameShape m_shape;
		std::unique_ptr<Slot[]> m_slots;
		std::atomic<uint64_t> m_latestIndex;
		mutable std::atomic<uint64_t> m_numSnapshotRetries;
	};
}

#endif //!__RINGBUFFER_H__
