#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>

#include <gtest/gtest.h>

#include <ggpkres/Logger.h>

using namespace GgpkRes;

namespace {
	bool Contains(const std::shared_ptr<Logger>& logger, const std::string& text) {
		bool found = false;
		logger->WithLogs([&](const std::deque<Logger::LogItem>& items) {
			found = std::any_of(items.begin(), items.end(), [&text](const Logger::LogItem& item) { return item.log == text; });
		});
		return found;
	}

	std::string ReadText(const std::filesystem::path& path) {
		std::ifstream in(path, std::ios::binary);
		return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
	}
}

class LoggerTest : public testing::Test {
protected:
	std::shared_ptr<Logger> m_logger = Logger::Acquire();

	void SetUp() override {
		m_logger->SetMinimumLevel(LogLevel::Debug);
		m_logger->Flush();
		m_logger->Clear();
	}

	void TearDown() override {
		m_logger->SetLogFile({});
	}
};

TEST_F(LoggerTest, AcquireSharesInstance) {
	EXPECT_EQ(Logger::Acquire(), m_logger);
}

TEST_F(LoggerTest, FlushDispatchesPendingItems) {
	m_logger->Log(LogCategory::General, "first");
	m_logger->Log(LogCategory::ArchiveFacade, std::string("second"), LogLevel::Warning, nlohmann::json{ {"Path", "Data"} });
	m_logger->Flush();

	EXPECT_TRUE(Contains(m_logger, "first"));
	m_logger->WithLogs([](const std::deque<Logger::LogItem>& items) {
		ASSERT_EQ(items.size(), 2u);
		EXPECT_LT(items[0].id, items[1].id);
		EXPECT_EQ(items[1].level, LogLevel::Warning);
		EXPECT_EQ(items[1].category, LogCategory::ArchiveFacade);
		EXPECT_EQ(items[1].context.value("Path", std::string()), "Data");
	});

	m_logger->Clear();
	m_logger->WithLogs([](const std::deque<Logger::LogItem>& items) {
		EXPECT_TRUE(items.empty());
	});
}

TEST_F(LoggerTest, MinimumLevelFiltersItems) {
	m_logger->SetMinimumLevel(LogLevel::Warning);
	EXPECT_EQ(m_logger->MinimumLevel(), LogLevel::Warning);

	m_logger->Log(LogCategory::General, "quiet", LogLevel::Info);
	m_logger->Format<LogLevel::Debug>(LogCategory::General, "also ", "quiet");
	m_logger->Log(LogCategory::General, "loud", LogLevel::Error);
	m_logger->Flush();

	EXPECT_FALSE(Contains(m_logger, "quiet"));
	EXPECT_FALSE(Contains(m_logger, "also quiet"));
	EXPECT_TRUE(Contains(m_logger, "loud"));
}

TEST_F(LoggerTest, FormatStreamsArguments) {
	m_logger->Format<LogLevel::Warning>(LogCategory::Config, "value ", 42, ' ', 2.5, " of ", std::string("x"));
	m_logger->Flush();
	EXPECT_TRUE(Contains(m_logger, "value 42 2.5 of x"));
}

TEST_F(LoggerTest, ListenersReceiveBatches) {
	std::mutex mtx;
	std::vector<std::string> received;
	const auto subscription = m_logger->OnNewLogItem([&](const std::deque<Logger::LogItem>& items) {
		std::lock_guard lock(mtx);
		for (const auto& item : items)
			received.push_back(item.log);
	});

	m_logger->Log(LogCategory::General, "one");
	m_logger->Log(LogCategory::General, "two");
	m_logger->Flush();

	std::lock_guard lock(mtx);
	EXPECT_EQ(received, (std::vector<std::string>{ "one", "two" }));
}

TEST_F(LoggerTest, ItemFormatIsTabSeparated) {
	const Logger::LogItem item{ 1, LogCategory::IndexMaterializer, std::chrono::system_clock::time_point{}, LogLevel::Info, "hello", nullptr };
	EXPECT_EQ(item.Format(), "1970-01-01T00:00:00.000Z\tInfo\tIndexMaterializer\thello");

	auto withContext = item;
	withContext.context = nlohmann::json{ {"Key", 1} };
	EXPECT_EQ(withContext.Format(), "1970-01-01T00:00:00.000Z\tInfo\tIndexMaterializer\thello\t{\"Key\":1}");
}

TEST_F(LoggerTest, LogFileReceivesLines) {
	const auto dir = std::filesystem::temp_directory_path() / ("ggpkres-log-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
	const auto path = dir / "nested" / "ggpkres.log";

	m_logger->SetLogFile(path);
	m_logger->Log(LogCategory::ArchiveService, std::string("written"), LogLevel::Warning, nlohmann::json{ {"Key", 1} });
	m_logger->Flush();
	m_logger->SetLogFile({});
	m_logger->Log(LogCategory::ArchiveService, "not written");
	m_logger->Flush();

	const auto text = ReadText(path);
	EXPECT_NE(text.find("\tWarning\tArchiveService\twritten\t{\"Key\":1}\n"), std::string::npos);
	EXPECT_EQ(text.find("not written"), std::string::npos);

	std::error_code ec;
	remove_all(dir, ec);
}

TEST_F(LoggerTest, UnwritableLogFileThrows) {
	EXPECT_THROW(m_logger->SetLogFile(std::filesystem::temp_directory_path()), std::runtime_error);
}

TEST_F(LoggerTest, InvalidUtf8ContextIsWrittenWithReplacement) {
	const auto dir = std::filesystem::temp_directory_path() / ("ggpkres-log-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
	const auto path = dir / "ggpkres.log";

	m_logger->SetLogFile(path);
	m_logger->Log(LogCategory::ArchiveFacade, std::string("odd path"), LogLevel::Error, nlohmann::json{ {"FilePath", "/games/\xff.ggpk"} });
	m_logger->Log(LogCategory::ArchiveFacade, "after");
	m_logger->Flush();
	m_logger->SetLogFile({});

	const auto text = ReadText(path);
	EXPECT_NE(text.find("\todd path\t{\"FilePath\":\"/games/\xEF\xBF\xBD.ggpk\"}\n"), std::string::npos);
	EXPECT_NE(text.find("\tafter\n"), std::string::npos);

	std::error_code ec;
	remove_all(dir, ec);
}

TEST_F(LoggerTest, ThrowingListenerDoesNotStopDispatch) {
	const auto throwing = m_logger->OnNewLogItem([](const std::deque<Logger::LogItem>&) {
		throw std::runtime_error("listener broke");
	});

	m_logger->Log(LogCategory::General, "first");
	m_logger->Flush();
	m_logger->Log(LogCategory::General, "second");
	m_logger->Flush();

	EXPECT_TRUE(Contains(m_logger, "second"));
	EXPECT_TRUE(Contains(m_logger, "Log listener failed: listener broke"));
}
