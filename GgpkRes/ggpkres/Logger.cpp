#include "Logger.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <thread>

#include "ErrorContext.h"

const char* GgpkRes::LogLevelName(LogLevel level) {
	switch (level) {
		case LogLevel::Unset:
			return "Unset";
		case LogLevel::Debug:
			return "Debug";
		case LogLevel::Info:
			return "Info";
		case LogLevel::Warning:
			return "Warning";
		case LogLevel::Error:
			return "Error";
	}
	return "Unknown";
}

const char* GgpkRes::LogCategoryName(LogCategory category) {
	switch (category) {
		case LogCategory::General:
			return "General";
		case LogCategory::ArchiveFacade:
			return "ArchiveFacade";
		case LogCategory::IndexMaterializer:
			return "IndexMaterializer";
		case LogCategory::ArchiveService:
			return "ArchiveService";
		case LogCategory::Config:
			return "Config";
	}
	return "Unknown";
}

std::weak_ptr<GgpkRes::Logger> GgpkRes::Logger::s_instance;

struct GgpkRes::Logger::Implementation final {
	static const size_t MaxLogCount = 128 * 1024;
	Logger& logger;
	std::condition_variable m_threadTrigger;
	std::condition_variable m_dispatched;

	bool m_bQuitting = false;
	std::mutex m_pendingItemLock;
	mutable std::mutex m_itemLock;
	std::deque<LogItem> m_items, m_pendingItems;
	uint64_t m_logIdCounter = 1;
	uint64_t m_lastDispatchedId = 0;

	std::atomic<LogLevel> m_minimumLevel = LogLevel::Debug;

	std::mutex m_fileLock;
	std::ofstream m_file;

	// needs to be last, as "this" needs to be done initializing
	std::thread m_dispatcherThread;

	Implementation(Logger& logger)
		: logger(logger)
		, m_dispatcherThread([this]() { DispatcherThreadBody(); }) {
	}

	~Implementation() {
		Stop();
	}

	void Stop() {
		{
			std::lock_guard lock(m_pendingItemLock);
			m_bQuitting = true;
		}
		m_threadTrigger.notify_all();
		if (m_dispatcherThread.joinable())
			m_dispatcherThread.join();
	}

	void DispatcherThreadBody() {
		while (true) {
			std::deque<LogItem> pendingItems;
			{
				std::unique_lock lock(m_pendingItemLock);
				m_threadTrigger.wait(lock, [this]() { return m_bQuitting || !m_pendingItems.empty(); });
				if (m_pendingItems.empty() && m_bQuitting)
					return;
				pendingItems = std::move(m_pendingItems);
				m_pendingItems.clear();
			}
			{
				std::lock_guard lock(m_itemLock);
				for (auto& item : pendingItems) {
					m_items.push_back(item);
					if (m_items.size() > MaxLogCount)
						m_items.pop_front();
				}
			}
			try {
				WriteToFile(pendingItems);
			} catch (const std::exception& e) {
				KeepDispatchFailure("Failed to write log file: ", e, pendingItems.back().id);
			}
			try {
				logger.OnNewLogItem(pendingItems);
			} catch (const std::exception& e) {
				KeepDispatchFailure("Log listener failed: ", e, pendingItems.back().id);
			}

			{
				std::lock_guard lock(m_pendingItemLock);
				m_lastDispatchedId = (std::max)(m_lastDispatchedId, pendingItems.back().id);
			}
			m_dispatched.notify_all();
		}
	}

	// Stored directly into the ring; dispatching it would feed the failure back into itself.
	void KeepDispatchFailure(const char* what, const std::exception& e, uint64_t batchId) {
		std::lock_guard lock(m_itemLock);
		m_items.push_back(LogItem{ batchId, LogCategory::General, std::chrono::system_clock::now(), LogLevel::Error, std::string(what) + e.what(), nullptr });
		if (m_items.size() > MaxLogCount)
			m_items.pop_front();
	}

	void WriteToFile(const std::deque<LogItem>& items) {
		std::lock_guard lock(m_fileLock);
		if (!m_file.is_open())
			return;
		for (const auto& item : items)
			m_file << item.Format() << '\n';
		m_file.flush();
	}

	void AddLogItem(LogItem item) {
		std::lock_guard lock(m_pendingItemLock);
		item.id = m_logIdCounter++;
		m_pendingItems.push_back(std::move(item));
		while (m_pendingItems.size() > MaxLogCount)
			m_pendingItems.pop_front();
		m_threadTrigger.notify_all();
	}

	void WaitForDispatch() {
		std::unique_lock lock(m_pendingItemLock);
		const auto target = m_logIdCounter - 1;
		m_dispatched.wait(lock, [this, target]() { return m_lastDispatchedId >= target; });
	}
};

class GgpkRes::Logger::LoggerCreator : public Logger {
public:
	LoggerCreator() = default;
	~LoggerCreator() override = default;
};

std::string GgpkRes::Logger::LogItem::Format() const {
	std::string res = FormatUtcTimestamp(timestamp);
	res += '\t';
	res += LogLevelName(level);
	res += '\t';
	res += LogCategoryName(category);
	res += '\t';
	res += log;
	if (!context.is_null()) {
		res += '\t';
		// Paths may carry bytes that are not valid UTF-8.
		res += context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	}
	return res;
}

GgpkRes::Logger::Logger()
	: m_pImpl(std::make_unique<Implementation>(*this)) {
}

std::shared_ptr<GgpkRes::Logger> GgpkRes::Logger::Acquire() {
	auto r = s_instance.lock();
	if (!r) {
		static std::mutex mtx;
		std::lock_guard lock(mtx);

		r = s_instance.lock();
		if (!r)
			s_instance = r = std::make_shared<LoggerCreator>();
	}
	return r;
}

GgpkRes::Logger::~Logger() {
	// Listeners are destroyed before the implementation; the dispatcher must not outlive them.
	m_pImpl->Stop();
}

void GgpkRes::Logger::Log(LogCategory category, const char* s, LogLevel level) {
	Log(category, std::string(s), level);
}

void GgpkRes::Logger::Log(LogCategory category, const std::string& s, LogLevel level, nlohmann::json context) {
	if (level < m_pImpl->m_minimumLevel)
		return;

	m_pImpl->AddLogItem(LogItem{
		0,
		category,
		std::chrono::system_clock::now(),
		level,
		s,
		std::move(context),
	});
}

void GgpkRes::Logger::Clear() {
	std::lock_guard lock(m_pImpl->m_itemLock);
	std::lock_guard lock2(m_pImpl->m_pendingItemLock);
	m_pImpl->m_items.clear();
	m_pImpl->m_pendingItems.clear();
	m_pImpl->m_lastDispatchedId = m_pImpl->m_logIdCounter - 1;
	m_pImpl->m_dispatched.notify_all();
}

void GgpkRes::Logger::Flush() {
	m_pImpl->WaitForDispatch();
}

void GgpkRes::Logger::SetMinimumLevel(LogLevel level) {
	m_pImpl->m_minimumLevel = level;
}

GgpkRes::LogLevel GgpkRes::Logger::MinimumLevel() const {
	return m_pImpl->m_minimumLevel;
}

void GgpkRes::Logger::SetLogFile(const std::filesystem::path& path) {
	std::lock_guard lock(m_pImpl->m_fileLock);
	if (m_pImpl->m_file.is_open())
		m_pImpl->m_file.close();
	if (path.empty())
		return;

	if (path.has_parent_path())
		create_directories(path.parent_path());
	m_pImpl->m_file.open(path, std::ios::app);
	if (!m_pImpl->m_file)
		throw std::runtime_error("Failed to open log file: " + path.string());
}

void GgpkRes::Logger::WithLogs(const std::function<void(const std::deque<LogItem>& items)>& cb) const {
	std::lock_guard lock(m_pImpl->m_itemLock);
	cb(m_pImpl->m_items);
}
