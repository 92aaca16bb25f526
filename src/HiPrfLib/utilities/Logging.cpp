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

#include "Logging.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

#include "utility.h"

namespace hiprf
{
	namespace logging
	{
		namespace
		{
			std::mutex g_logMutex;
			std::ofstream g_logFile;

			const char* severityPrefix(SeverityMask severity)
			{
				switch (severity)
				{
				case info:
					return "info: ";
				case warning:
					return "warning: ";
				case error:
					return "error: ";
				case log:
					return "log: ";
				case param:
					return "param: ";
				case external:
					return "external: ";
				case profiling:
					return "profiling: ";
				case always:
				default:
					return "";
				}
			}
		}

		std::atomic<uint32_t> Base::sm_logLevel(info | warning | error | logging::log | external);

		void Base::setLogLevel(uint32_t logLevel)
		{
			sm_logLevel = logLevel;
		}

		uint32_t Base::getLogLevel()
		{
			return sm_logLevel;
		}

		void Base::setLogFile(const std::string& filename)
		{
			std::lock_guard<std::mutex> lock(g_logMutex);
			if (g_logFile.is_open())
			{
				g_logFile.close();
			}
			if (!filename.empty())
			{
				g_logFile.open(filename, std::ios_base::out | std::ios_base::app);
				if (!g_logFile.good())
				{
					std::cerr << "error: could not open log file '" << filename << "'" << std::endl;
				}
			}
		}

		void Base::write(SeverityMask severity, const std::string& message)
		{
			std::lock_guard<std::mutex> lock(g_logMutex);
			std::ostream& console = (severity == error || severity == warning) ? std::cerr : std::cout;
			console << severityPrefix(severity) << message << std::endl;

			if (g_logFile.is_open())
			{
				g_logFile << std::fixed << std::setprecision(6) << getCurrentTime() << " "
					<< severityPrefix(severity) << message << std::endl;
			}
		}
	}
}
