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

#ifndef __MOCKPROCESSINGSINK_H__
#define __MOCKPROCESSINGSINK_H__

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include <gmock/gmock.h>

#include "AbstractProcessingSink.h"

namespace hiprf
{
	namespace mocks
	{
		class MockProcessingSink : public AbstractProcessingSink
		{
		public:
			MOCK_METHOD(void, accept, (std::shared_ptr<const Frame> frame), (override));
		};

		/// Records the acquisition indices it receives. While closed, accept() blocks
		/// until the gate is opened, which keeps the sink busy for as long as a test needs.
		class GatedProcessingSink : public AbstractProcessingSink
		{
		public:
			GatedProcessingSink()
				: m_open(true)
				, m_numWaiting(0) {}

			virtual void accept(std::shared_ptr<const Frame> frame)
			{
				std::unique_lock<std::mutex> lock(m_mutex);
				m_indices.push_back(frame->getAcquisitionIndex());
				m_numWaiting++;
				m_condition.notify_all();
				m_condition.wait(lock, [this] { return m_open; });
				m_numWaiting--;
			}

			void close()
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				m_open = false;
			}

			void open()
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				m_open = true;
				m_condition.notify_all();
			}

			/// Blocks until accept() has been entered the given number of times in total.
			/// On timeout the gate is opened, so that a late call cannot block the teardown,
			/// and false is returned.
			bool waitForCalls(size_t numCalls, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
			{
				std::unique_lock<std::mutex> lock(m_mutex);
				bool called = m_condition.wait_for(lock, timeout, [this, numCalls] { return m_indices.size() >= numCalls; });
				if (!called)
				{
					m_open = true;
					m_condition.notify_all();
				}
				return called;
			}

			std::vector<uint64_t> getIndices() const
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				return m_indices;
			}

		private:
			mutable std::mutex m_mutex;
			std::condition_variable m_condition;
			bool m_open;
			size_t m_numWaiting;
			std::vector<uint64_t> m_indices;
		};
	}
}

#endif //!__MOCKPROCESSINGSINK_H__
