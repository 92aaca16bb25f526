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

#ifndef __ACQUISITIONPIPELINE_H__
#define __ACQUISITIONPIPELINE_H__

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <tbb/concurrent_queue.h>

#include "AbstractProcessingSink.h"
#include "AbstractSupervisor.h"
#include "AbstractTriggerSource.h"
#include "AcquisitionGeometry.h"
#include "AcquisitionStatus.h"
#include "PipelineStatistics.h"
#include "RateController.h"
#include "RingBuffer.h"
#include "ThrottledDispatcher.h"
#include "TimingConfig.h"
#include "TriggerScheduler.h"
#include "utilities/ConfigurationDictionary.h"
#include "utilities/ValueRangeDictionary.h"

namespace hiprf
{
	/// Owns and connects the components of one acquisition flow: ring buffer, timing
	/// configuration, rate controller, trigger scheduler and throttled dispatcher.
	///
	/// The parameters are declared in the value range dictionary and read from the
	/// configuration on construction. Timing parameters can be changed at any time,
	/// the geometry only before the first start.
	///
	/// If no trigger source is given and "simulateMode" is set, a SimulatedTriggerSource is used.
	class AcquisitionPipeline
	{
	public:
		AcquisitionPipeline(const ConfigurationDictionary& configuration,
			std::shared_ptr<AbstractProcessingSink> sink,
			AbstractSupervisor* supervisor = nullptr,
			std::shared_ptr<AbstractTriggerSource> triggerSource = nullptr);
		~AcquisitionPipeline();

		void start();
		/// Takes effect at the next cycle boundary, does not wait
		void stop();
		/// Waits until the acquisition flow has ended and the sink is idle.
		/// Must not be called from the acquisition thread.
		AcquisitionStatus waitForTermination();
		bool isRunning() const;

		/// Never blocks. The request is applied at the next control checkpoint.
		void postRateRequest(const RateRequest& request);

		/// Validates the value against the declared range and applies it.
		/// Returns InvalidParameter or PeriodTooShort if the change was rejected.
		template <typename ValueType>
		AcquisitionStatus changeConfig(const std::string& configKey, const ValueType& value)
		{
			const ValueRangeEntry<ValueType>* range = m_valueRangeDictionary.get<ValueType>(configKey);
			if (!range || !range->isInRange(value))
			{
				logging::log_warn("AcquisitionPipeline: Rejected value ", value, " for parameter '", configKey, "'");
				return AcquisitionStatus::InvalidParameter;
			}

			std::lock_guard<std::mutex> lock(m_objectMutex);
			bool hadValue = m_configurationDictionary.hasKey(configKey);
			ValueType previousValue = m_configurationDictionary.get<ValueType>(configKey);
			m_configurationDictionary.set<ValueType>(configKey, value);

			AcquisitionStatus status = configurationEntryChanged(configKey);
			if (status != AcquisitionStatus::Ok)
			{
				if (hadValue)
				{
					m_configurationDictionary.set<ValueType>(configKey, previousValue);
				}
				else
				{
					m_configurationDictionary.remove(configKey);
				}
			}
			return status;
		}

		AcquisitionStatus changeConfig(const std::string& configKey, const char* value)
		{
			return changeConfig<std::string>(configKey, std::string(value));
		}

		const ValueRangeDictionary& getValueRangeDictionary() const { return m_valueRangeDictionary; }
		const ConfigurationDictionary& getConfigurationDictionary() const { return m_configurationDictionary; }

		PipelineStatistics getStatistics() const;
		AcquisitionStatus getTerminalStatus() const { return m_terminalStatus; }
		const AcquisitionGeometry& getGeometry() const { return m_geometry; }
		const RingBuffer& getRingBuffer() const { return *m_ringBuffer; }
		const TimingConfig& getTimingConfig() const { return *m_timingConfig; }
		RateController& getRateController() { return *m_rateController; }
		AbstractTriggerSource& getTriggerSource() { return *m_triggerSource; }

	private:
		void declareParameters();
		void configurationChanged();
		AcquisitionStatus configurationEntryChanged(const std::string& configKey);
		void build();

		void controlCheckpoint(uint64_t acquisitionCounter);
		void acquisitionTerminated(AcquisitionStatus status);

		ValueRangeDictionary m_valueRangeDictionary;
		ConfigurationDictionary m_configurationDictionary;

		// serializes configuration changes and lifecycle calls
		std::mutex m_objectMutex;

		AcquisitionGeometry m_geometry;
		size_t m_capacity;
		uint32_t m_rxElement;
		uint32_t m_simulatedLatency;
		uint64_t m_acquisitionLimit;
		TimingParameters m_initialTiming;
		DispatchPolicy m_dispatchPolicy;
		bool m_simulateMode;
		bool m_ownsTriggerSource;
		bool m_started;

		std::shared_ptr<AbstractProcessingSink> m_sink;
		AbstractSupervisor* m_supervisor;
		tbb::concurrent_queue<RateRequest> m_rateRequests;
		std::atomic<AcquisitionStatus> m_terminalStatus;

		// destroyed in reverse order: the scheduler stops before the dispatcher and the source go away
		std::unique_ptr<RingBuffer> m_ringBuffer;
		std::unique_ptr<TimingConfig> m_timingConfig;
		std::unique_ptr<RateController> m_rateController;
		std::shared_ptr<AbstractTriggerSource> m_triggerSource;
		std::unique_ptr<ThrottledDispatcher> m_dispatcher;
		std::unique_ptr<TriggerScheduler> m_scheduler;
	};
}

#endif //!__ACQUISITIONPIPELINE_H__
