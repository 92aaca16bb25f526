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

#include "AcquisitionPipeline.h"

#include <cmath>
#include <functional>
#include <stdexcept>

#include "InputOutput/SimulatedTriggerSource.h"
#include "utilities/Logging.h"

using namespace std;
using namespace std::placeholders;

namespace hiprf
{
	using logging::log_info;
	using logging::log_log;
	using logging::log_warn;

	AcquisitionPipeline::AcquisitionPipeline(const ConfigurationDictionary& configuration,
		std::shared_ptr<AbstractProcessingSink> sink,
		AbstractSupervisor* supervisor,
		std::shared_ptr<AbstractTriggerSource> triggerSource)
		: m_capacity(0)
		, m_rxElement(0)
		, m_simulatedLatency(0)
		, m_acquisitionLimit(0)
		, m_initialTiming()
		, m_dispatchPolicy(DispatchPolicy::SkipWhenBusy)
		, m_simulateMode(false)
		, m_ownsTriggerSource(!triggerSource)
		, m_started(false)
		, m_sink(sink)
		, m_supervisor(supervisor)
		, m_terminalStatus(AcquisitionStatus::Ok)
		, m_triggerSource(triggerSource)
	{
		if (!m_sink)
		{
			throw std::invalid_argument("AcquisitionPipeline: a processing sink is required");
		}

		// Define the parameters that the pipeline reveals to the user
		declareParameters();

		m_configurationDictionary = configuration;
		m_configurationDictionary.setValueRangeDictionary(&m_valueRangeDictionary);
		size_t numRemoved = m_configurationDictionary.checkEntries();
		if (numRemoved > 0)
		{
			log_warn("AcquisitionPipeline: Ignored ", numRemoved, " unknown or invalid parameters");
		}

		// read the configuration to apply the default values
		configurationChanged();
		if (m_ownsTriggerSource && !m_simulateMode)
		{
			throw std::invalid_argument("AcquisitionPipeline: no trigger source given and simulateMode is off");
		}
		build();
	}

	AcquisitionPipeline::~AcquisitionPipeline()
	{
		if (m_scheduler)
		{
			m_scheduler->stop();
			m_scheduler->join();
		}
		m_scheduler.reset();
		m_dispatcher.reset();
	}

	void AcquisitionPipeline::declareParameters()
	{
		m_valueRangeDictionary.set<uint32_t>("numFrames", 1, 100000, 1000, "Ring buffer capacity [frames]");
		m_valueRangeDictionary.set<uint32_t>("rowsPerFrame", 1, 16384, 1024, "Samples per channel");
		m_valueRangeDictionary.set<uint32_t>("numChannels", 1, 1024, 128, "Receive channels");
		m_valueRangeDictionary.set<uint32_t>("rxElement", 0, 1023, 64, "Active receive element");
		m_valueRangeDictionary.set<double>("startDepth", 0.0, 1000.0, 5.0, "Start depth [wavelengths]");
		m_valueRangeDictionary.set<double>("endDepth", 0.0, 1000.0, 50.0, "End depth [wavelengths]");
		m_valueRangeDictionary.set<double>("speedOfSound", 100.0, 10000.0, 1540.0, "Speed of sound [m/s]");
		m_valueRangeDictionary.set<double>("centerFrequency", 0.1, 100.0, 6.25, "Transducer center frequency [MHz]");
		m_valueRangeDictionary.set<double>("transferRate", 1.0, 1e6, 6600.0, "Host transfer rate [bytes/us]");
		m_valueRangeDictionary.set<double>("setupOverhead", 0.0, 10000.0, 10.0, "Setup time per acquisition [us]");
		m_valueRangeDictionary.set<double>("txPulseRepetitionFrequency",
			RateController::c_minPulseRepetitionFrequency, RateController::c_maxPulseRepetitionFrequency, 10.0,
			"Pulse repetition frequency [kHz]");
		m_valueRangeDictionary.set<uint32_t>("timeToNextAcq", 1, 1000000, 100, "Time between acquisitions [us]");
		m_valueRangeDictionary.set<uint32_t>("processingCadence", 1, 1000000, 100, "Acquisitions per processed frame");
		m_valueRangeDictionary.set<uint32_t>("controlCadence", 1, 1000000, 200, "Acquisitions per control checkpoint");
		m_valueRangeDictionary.set<string>("dispatchPolicy", {"skip", "strict"}, "skip", "Busy processing policy");
		m_valueRangeDictionary.set<uint32_t>("numAcquisitions", 0, 4000000000u, 0, "Acquisitions until stop (0: unlimited)");
		m_valueRangeDictionary.set<bool>("simulateMode", {false, true}, true, "Simulated trigger source");
		m_valueRangeDictionary.set<uint32_t>("simulatedLatency", 0, 1000000, 20, "Simulated acquisition latency [us]");
	}

	// change of multiple values in configuration result in a re-initialization of the pipeline
	void AcquisitionPipeline::configurationChanged()
	{
		AcquisitionGeometry geometry;
		geometry.startDepth = m_configurationDictionary.get<double>("startDepth");
		geometry.endDepth = m_configurationDictionary.get<double>("endDepth");
		geometry.speedOfSound = m_configurationDictionary.get<double>("speedOfSound");
		geometry.centerFrequency = m_configurationDictionary.get<double>("centerFrequency");
		geometry.frameShape.numRows = m_configurationDictionary.get<uint32_t>("rowsPerFrame");
		geometry.frameShape.numChannels = m_configurationDictionary.get<uint32_t>("numChannels");
		geometry.transferRate = m_configurationDictionary.get<double>("transferRate");
		geometry.setupOverhead = m_configurationDictionary.get<double>("setupOverhead");
		if (!geometry.isValid())
		{
			throw std::invalid_argument("AcquisitionPipeline: invalid geometry, the start depth has to be below the end depth");
		}

		uint32_t rxElement = m_configurationDictionary.get<uint32_t>("rxElement");
		if (rxElement >= geometry.frameShape.numChannels)
		{
			throw std::invalid_argument("AcquisitionPipeline: rxElement " + std::to_string(rxElement) +
				" outside of the " + std::to_string(geometry.frameShape.numChannels) + " channels");
		}

		TimingParameters timing;
		if (m_configurationDictionary.hasKey("txPulseRepetitionFrequency"))
		{
			double prf = m_configurationDictionary.get<double>("txPulseRepetitionFrequency");
			timing.periodMicroseconds = static_cast<uint32_t>(std::round(1000.0 / prf));
		}
		else
		{
			timing.periodMicroseconds = m_configurationDictionary.get<uint32_t>("timeToNextAcq");
		}
		timing.processingCadence = m_configurationDictionary.get<uint32_t>("processingCadence");
		timing.controlCadence = m_configurationDictionary.get<uint32_t>("controlCadence");

		uint32_t minimumPeriod = geometry.getMinimumPeriod();
		if (timing.periodMicroseconds < minimumPeriod)
		{
			throw std::invalid_argument("AcquisitionPipeline: period of " + std::to_string(timing.periodMicroseconds) +
				" us is below the minimum of " + std::to_string(minimumPeriod) + " us");
		}

		DispatchPolicy policy;
		std::string policyName = m_configurationDictionary.get<string>("dispatchPolicy");
		if (!dispatchPolicyFromString(policyName, policy))
		{
			throw std::invalid_argument("AcquisitionPipeline: unknown dispatch policy '" + policyName + "'");
		}

		m_geometry = geometry;
		m_capacity = m_configurationDictionary.get<uint32_t>("numFrames");
		m_rxElement = rxElement;
		m_initialTiming = timing;
		m_dispatchPolicy = policy;
		m_acquisitionLimit = m_configurationDictionary.get<uint32_t>("numAcquisitions");
		m_simulateMode = m_configurationDictionary.get<bool>("simulateMode");
		m_simulatedLatency = m_configurationDictionary.get<uint32_t>("simulatedLatency");

		if (m_simulateMode && m_ownsTriggerSource &&
			m_simulatedLatency >= TriggerScheduler::c_timeoutPeriods * timing.periodMicroseconds)
		{
			log_warn("AcquisitionPipeline: Simulated latency of ", m_simulatedLatency,
				" us exceeds the acquisition timeout, every acquisition will time out");
		}

		log_log("AcquisitionPipeline: ", m_capacity, " frames of ", m_geometry.frameShape.numRows, " x ",
			m_geometry.frameShape.numChannels, " samples, period ", timing.periodMicroseconds, " us (min ", minimumPeriod,
			" us), processing every ", timing.processingCadence, ", control every ", timing.controlCadence,
			", policy ", dispatchPolicyToString(m_dispatchPolicy));
	}

	AcquisitionStatus AcquisitionPipeline::configurationEntryChanged(const std::string& configKey)
	{
		if (configKey == "timeToNextAcq")
		{
			AcquisitionStatus status = m_rateController->setPeriod(m_configurationDictionary.get<uint32_t>("timeToNextAcq"));
			if (status == AcquisitionStatus::Ok)
			{
				m_configurationDictionary.remove("txPulseRepetitionFrequency");
			}
			return status;
		}
		if (configKey == "txPulseRepetitionFrequency")
		{
			AcquisitionStatus status = m_rateController->setPulseRepetitionFrequency(
				m_configurationDictionary.get<double>("txPulseRepetitionFrequency"));
			if (status == AcquisitionStatus::Ok)
			{
				m_configurationDictionary.set<uint32_t>("timeToNextAcq", m_rateController->getPeriod());
			}
			return status;
		}
		if (configKey == "processingCadence" || configKey == "controlCadence")
		{
			return m_rateController->setCadences(
				m_configurationDictionary.get<uint32_t>("processingCadence"),
				m_configurationDictionary.get<uint32_t>("controlCadence"));
		}
		if (configKey == "dispatchPolicy")
		{
			if (!dispatchPolicyFromString(m_configurationDictionary.get<string>("dispatchPolicy"), m_dispatchPolicy))
			{
				return AcquisitionStatus::InvalidParameter;
			}
			m_dispatcher->setPolicy(m_dispatchPolicy);
			return AcquisitionStatus::Ok;
		}

		// everything else shapes the buffers and the source
		if (m_started)
		{
			log_warn("AcquisitionPipeline: Parameter '", configKey, "' can only be changed before the first start");
			return AcquisitionStatus::InvalidParameter;
		}
		try
		{
			configurationChanged();
		}
		catch (const std::invalid_argument& e)
		{
			log_warn(e.what());
			return AcquisitionStatus::InvalidParameter;
		}
		build();
		return AcquisitionStatus::Ok;
	}

	void AcquisitionPipeline::build()
	{
		m_scheduler.reset();
		m_dispatcher.reset();

		m_ringBuffer = unique_ptr<RingBuffer>(new RingBuffer(m_capacity, m_geometry.frameShape));
		m_timingConfig = unique_ptr<TimingConfig>(new TimingConfig(m_initialTiming));
		m_rateController = unique_ptr<RateController>(new RateController(*m_timingConfig, m_geometry));
		if (m_ownsTriggerSource)
		{
			m_triggerSource.reset();
			m_triggerSource = make_shared<SimulatedTriggerSource>(m_geometry, m_rxElement, m_simulatedLatency);
		}

		m_dispatcher = unique_ptr<ThrottledDispatcher>(
			new ThrottledDispatcher(*m_ringBuffer, *m_timingConfig, *m_sink, m_dispatchPolicy));
		m_dispatcher->setControlCallback(std::bind(&AcquisitionPipeline::controlCheckpoint, this, _1));

		m_scheduler = unique_ptr<TriggerScheduler>(new TriggerScheduler(*m_ringBuffer, *m_timingConfig, *m_triggerSource));
		m_scheduler->setAcquisitionCallback(std::bind(&ThrottledDispatcher::onAcquisition, m_dispatcher.get(), _1));
		m_scheduler->setTerminationCallback(std::bind(&AcquisitionPipeline::acquisitionTerminated, this, _1));
		m_scheduler->setAcquisitionLimit(m_acquisitionLimit);
	}

	void AcquisitionPipeline::start()
	{
		lock_guard<mutex> lock(m_objectMutex);
		if (m_scheduler->isRunning())
		{
			log_warn("AcquisitionPipeline: Already running");
			return;
		}
		m_started = true;
		m_terminalStatus = AcquisitionStatus::Ok;
		log_info("AcquisitionPipeline: Starting acquisition at ", 1000.0 / m_rateController->getPeriod(), " kHz");
		m_scheduler->start();
	}

	void AcquisitionPipeline::stop()
	{
		m_scheduler->stop();
	}

	AcquisitionStatus AcquisitionPipeline::waitForTermination()
	{
		m_scheduler->join();
		m_dispatcher->waitForSink();
		return m_terminalStatus;
	}

	bool AcquisitionPipeline::isRunning() const
	{
		return m_scheduler->isRunning();
	}

	void AcquisitionPipeline::postRateRequest(const RateRequest& request)
	{
		m_rateRequests.push(request);
	}

	void AcquisitionPipeline::controlCheckpoint(uint64_t acquisitionCounter)
	{
		RateRequest request;
		while (m_rateRequests.try_pop(request))
		{
			if (m_rateController->handleRequest(request) == AcquisitionStatus::Ok)
			{
				lock_guard<mutex> lock(m_objectMutex);
				m_configurationDictionary.set<uint32_t>("timeToNextAcq", request.newPeriodMicroseconds);
				m_configurationDictionary.remove("txPulseRepetitionFrequency");
			}
		}
		if (m_supervisor)
		{
			m_supervisor->controlCheckpoint(acquisitionCounter);
		}
	}

	void AcquisitionPipeline::acquisitionTerminated(AcquisitionStatus status)
	{
		m_terminalStatus = status;
		if (m_supervisor)
		{
			m_supervisor->acquisitionTerminated(status);
		}
	}

	PipelineStatistics AcquisitionPipeline::getStatistics() const
	{
		PipelineStatistics statistics;
		statistics.numAcquisitions = m_scheduler->getAcquisitionCounter();
		statistics.numTimeouts = m_scheduler->getNumTimeouts();
		statistics.numLateCompletions = m_scheduler->getNumLateCompletions();
		statistics.numForcedResets = m_scheduler->getNumForcedResets();
		statistics.numSnapshotRetries = m_ringBuffer->getNumSnapshotRetries();
		statistics.latestCompleteIndex = m_ringBuffer->getLatestCompleteIndex();
		statistics.measuredFrequency = m_scheduler->getMeasuredFrequency();

		statistics.numDispatched = m_dispatcher->getNumDispatched();
		statistics.numSkipped = m_dispatcher->getNumSkipped();
		statistics.numRescheduled = m_dispatcher->getNumRescheduled();
		statistics.numEmpty = m_dispatcher->getNumEmpty();
		statistics.numSinkErrors = m_dispatcher->getNumSinkErrors();
		statistics.lastDispatchedIndex = m_dispatcher->getLastDispatchedIndex();
		statistics.numControlCheckpoints = m_dispatcher->getNumControlCheckpoints();

		statistics.numRateChangesAccepted = m_rateController->getNumAccepted();
		statistics.numRateChangesRejected = m_rateController->getNumRejected();
		statistics.periodMicroseconds = m_rateController->getPeriod();
		statistics.minimumPeriodMicroseconds = m_rateController->getMinimumPeriod();

		statistics.terminalStatus = m_terminalStatus;
		return statistics;
	}
}
