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

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <AcquisitionPipeline.h>
#include <Processing/FrameInfoSink.h>
#include <utilities/Logging.h>

using namespace std;
using namespace hiprf;

namespace
{
	class CommandSupervisor : public AbstractSupervisor
	{
	public:
		CommandSupervisor()
			: m_numCheckpoints(0) {}

		virtual void controlCheckpoint(uint64_t)
		{
			m_numCheckpoints++;
		}

		virtual void acquisitionTerminated(AcquisitionStatus status)
		{
			logging::log_always("HiPrfCmd: Acquisition terminated with ", status, ", press q to quit");
		}

		uint64_t getNumCheckpoints() const { return m_numCheckpoints; }

	private:
		std::atomic<uint64_t> m_numCheckpoints;
	};

	void printUsage()
	{
		cout << "Commands:" << endl
			<< "  prf <kHz>                        set the pulse repetition frequency" << endl
			<< "  period <us>                      request a new period at the next checkpoint" << endl
			<< "  cadence <processing> <control>   set the dispatch and control cadences" << endl
			<< "  policy <skip|strict>             behaviour when processing is busy" << endl
			<< "  stats                            print the pipeline statistics" << endl
			<< "  q                                quit" << endl;
	}

	void report(AcquisitionStatus status)
	{
		if (status != AcquisitionStatus::Ok)
		{
			cout << "rejected: " << status << endl;
		}
	}
}

int main(int argc, char** argv)
{
	logging::Base::setLogFile("hiprf.log");
	// no per frame information, it would flood the console
	logging::Base::setLogLevel(logging::warning | logging::error | logging::log | logging::external);

	ConfigurationDictionary configuration;
	if (argc > 1)
	{
		configuration.set<double>("txPulseRepetitionFrequency", atof(argv[1]));
	}

	try
	{
		auto sink = make_shared<FrameInfoSink>("Frame", 64);
		CommandSupervisor supervisor;
		AcquisitionPipeline pipeline(configuration, sink, &supervisor);
		sink->setChannel(pipeline.getConfigurationDictionary().get<uint32_t>("rxElement"));

		pipeline.start();
		printUsage();

		string line;
		while (getline(cin, line))
		{
			istringstream command(line);
			string keyword;
			command >> keyword;

			if (keyword == "q")
			{
				break;
			}
			else if (keyword == "prf")
			{
				double kiloHertz;
				if (command >> kiloHertz)
				{
					report(pipeline.changeConfig<double>("txPulseRepetitionFrequency", kiloHertz));
					continue;
				}
			}
			else if (keyword == "period")
			{
				uint32_t period;
				if (command >> period)
				{
					RateRequest request;
					request.newPeriodMicroseconds = period;
					pipeline.postRateRequest(request);
					continue;
				}
			}
			else if (keyword == "cadence")
			{
				uint32_t processingCadence;
				uint32_t controlCadence;
				if (command >> processingCadence >> controlCadence)
				{
					report(pipeline.changeConfig<uint32_t>("processingCadence", processingCadence));
					report(pipeline.changeConfig<uint32_t>("controlCadence", controlCadence));
					continue;
				}
			}
			else if (keyword == "policy")
			{
				string policy;
				if (command >> policy)
				{
					report(pipeline.changeConfig("dispatchPolicy", policy.c_str()));
					continue;
				}
			}
			else if (keyword == "stats")
			{
				cout << pipeline.getStatistics() << ", supervisor checkpoints: " << supervisor.getNumCheckpoints() << endl;
				continue;
			}
			else if (keyword.empty())
			{
				continue;
			}
			printUsage();
		}

		pipeline.stop();
		AcquisitionStatus status = pipeline.waitForTermination();
		cout << pipeline.getStatistics() << endl;
		logging::Base::setLogFile("");
		return isFatal(status) ? EXIT_FAILURE : EXIT_SUCCESS;
	}
	catch (const std::exception& e)
	{
		logging::log_error("HiPrfCmd: ", e.what());
		logging::Base::setLogFile("");
		return EXIT_FAILURE;
	}
}
