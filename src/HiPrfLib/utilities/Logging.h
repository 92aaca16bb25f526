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

#ifndef __LOGGING_H__
#define __LOGGING_H__

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace hiprf
{
	namespace logging
	{
		enum SeverityMask : uint32_t
		{
			info = 1,
			warning = 2,
			error = 4,
			log = 8,
			param = 16,
			external = 32,
			profiling = 64,
			always = 128
		};

		class Base
		{
		public:
			template <typename... Args>
			static void log(SeverityMask severity, const Args&... args)
			{
				if ((severity & (sm_logLevel.load() | always)) == 0)
				{
					return;
				}
				std::ostringstream stream;
				logArgs(stream, args...);
				write(severity, stream.str());
			}

			static void setLogLevel(uint32_t logLevel);
			static uint32_t getLogLevel();
			// An empty filename closes the log file
			static void setLogFile(const std::string& filename);

		private:
			static void logArgs(std::ostringstream&) {}

			template <typename T, typename... Rest>
			static void logArgs(std::ostringstream& stream, const T& first, const Rest&... rest)
			{
				stream << first;
				logArgs(stream, rest...);
			}

			static void write(SeverityMask severity, const std::string& message);

			static std::atomic<uint32_t> sm_logLevel;
		};

		template <typename... Args>
		void log_info(const Args&... args)
		{
			Base::log(info, args...);
		}

		template <typename... Args>
		void log_warn(const Args&... args)
		{
			Base::log(warning, args...);
		}

		template <typename... Args>
		void log_error(const Args&... args)
		{
			Base::log(error, args...);
		}

		template <typename... Args>
		void log_log(const Args&... args)
		{
			Base::log(log, args...);
		}

		template <typename... Args>
		void log_param(const Args&... args)
		{
			Base::log(param, args...);
		}

		template <typename... Args>
		void log_profiling(const Args&... args)
		{
			Base::log(profiling, args...);
		}

		template <typename... Args>
		void log_always(const Args&... args)
		{
			Base::log(always, args...);
		}
	}
}

#endif //!__LOGGING_H__
