#ifndef _GGPKRES_LOGGER_H_
#define _GGPKRES_LOGGER_H_

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "Internal/ListenerManager.h"

namespace GgpkRes {
	enum class LogLevel {
		Unset = 0,
		Debug = 10,
		Info = 20,
		Warning = 30,
		Error = 40,
	};

	enum class LogCategory {
		General,
		ArchiveFacade,
		IndexMaterializer,
		ArchiveService,
		Config,
	};

	[[nodiscard]] const char* LogLevelName(LogLevel level);
	[[nodiscard]] const char* LogCategoryName(LogCategory category);

	NLOHMANN_JSON_SERIALIZE_ENUM(LogLevel, {
		{LogLevel::Unset, "Unset"},
		{LogLevel::Debug, "Debug"},
		{LogLevel::Info, "Info"},
		{LogLevel::Warning, "Warning"},
		{LogLevel::Error, "Error"},
	});

	class Logger {
	public:
		struct LogItem {
			uint64_t id;
			LogCategory category;
			std::chrono::system_clock::time_point timestamp;
			LogLevel level;
			std::string log;
			nlohmann::json context;

			[[nodiscard]] std::string Format() const;
		};

	protected:
		struct Implementation;
		const std::unique_ptr<Implementation> m_pImpl;

		class LoggerCreator;
		friend class LoggerCreator;
		Logger();
		static std::weak_ptr<Logger> s_instance;

	public:
		static std::shared_ptr<Logger> Acquire();

		Logger(Logger&&) = delete;
		Logger(const Logger&) = delete;
		Logger operator=(Logger&&) = delete;
		Logger operator=(const Logger&) = delete;
		virtual ~Logger();

		void Log(LogCategory category, const char* s, LogLevel level = LogLevel::Info);
		void Log(LogCategory category, const std::string& s, LogLevel level = LogLevel::Info, nlohmann::json context = nullptr);
		void Clear();

		/// \brief Blocks until every item logged before this call has been dispatched to listeners and the log file.
		void Flush();

		void SetMinimumLevel(LogLevel level);
		[[nodiscard]] LogLevel MinimumLevel() const;

		/// \brief Appends every subsequently dispatched item to the given file. An empty path stops writing.
		void SetLogFile(const std::filesystem::path& path);

		void WithLogs(const std::function<void(const std::deque<LogItem>& items)>& cb) const;
		Internal::ListenerManager<Logger, const std::deque<LogItem>&> OnNewLogItem;

		template <LogLevel Level = LogLevel::Info, typename ... Args>
		void Format(LogCategory category, Args&& ... args) {
			if (Level < MinimumLevel())
				return;
			std::ostringstream oss;
			(oss << ... << std::forward<Args>(args));
			Log(category, oss.str(), Level);
		}
	};
}

#endif
