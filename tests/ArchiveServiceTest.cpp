#include <algorithm>
#include <chrono>
#include <fstream>

#include <gtest/gtest.h>

#include <ggpkres/ArchiveService.h>

#include "FakeLibrary.h"

using namespace GgpkRes;
using namespace GgpkRes::Testing;

namespace {
	std::vector<std::string> NamesOf(const std::vector<Node>& nodes) {
		std::vector<std::string> names;
		for (const auto& node : nodes)
			names.push_back(node.Name());
		std::sort(names.begin(), names.end());
		return names;
	}

	std::vector<uint8_t> ReadAll(const std::filesystem::path& path) {
		std::ifstream in(path, std::ios::binary);
		return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
	}

	// A file that passes the pre-open checks: record length, "GGPK" tag, padding.
	std::vector<uint8_t> ArchiveHeader(size_t size = 2048) {
		std::vector<uint8_t> data(size);
		data[0] = 28;
		data[4] = 'G';
		data[5] = 'G';
		data[6] = 'P';
		data[7] = 'K';
		return data;
	}
}

class ArchiveServiceTest : public testing::Test {
protected:
	std::filesystem::path m_dir;
	std::shared_ptr<Config> m_config = std::make_shared<Config>();
	std::vector<ErrorEvent> m_errors;

	void SetUp() override {
		m_dir = std::filesystem::temp_directory_path() / ("ggpkres-test-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
		create_directories(m_dir);
	}

	void TearDown() override {
		std::error_code ec;
		remove_all(m_dir, ec);
	}

	std::filesystem::path WriteFile(const std::string& name, const std::vector<uint8_t>& data) {
		const auto path = m_dir / name;
		std::ofstream out(path, std::ios::binary);
		out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
		return path;
	}

	std::unique_ptr<ArchiveService> OpenService(std::shared_ptr<FakeLibrary> library) {
		auto service = std::make_unique<ArchiveService>(std::move(library), m_config);
		EXPECT_TRUE(service->OpenArchive(WriteFile("Content.ggpk", ArchiveHeader())));
		return service;
	}

	Internal::CallOnDestruction CollectErrors(ArchiveService& service) {
		return service.OnError([this](const ErrorEvent& e) { m_errors.push_back(e); });
	}
};

TEST_F(ArchiveServiceTest, OpenArchiveAnnouncesLoad) {
	ArchiveService service(MakeBundledLibrary(), m_config);
	std::optional<ArchiveLoadedEvent> loaded;
	const auto subscription = service.OnLoaded([&loaded](const ArchiveLoadedEvent& e) { loaded = e; });

	const auto path = WriteFile("Content.ggpk", ArchiveHeader());
	ASSERT_TRUE(service.OpenArchive(path));

	ASSERT_TRUE(loaded);
	EXPECT_EQ(loaded->FilePath.string(), path.string());
	EXPECT_TRUE(loaded->IsBundled);
	EXPECT_EQ(loaded->Version, 3u);
	EXPECT_TRUE(service.IsLoaded());
	EXPECT_TRUE(service.IsBundled());
	ASSERT_TRUE(service.CurrentFilePath());
	EXPECT_EQ(service.CurrentFilePath()->string(), path.string());
	ASSERT_TRUE(service.Version());
	EXPECT_EQ(*service.Version(), 3u);

	service.CloseArchive();
	EXPECT_FALSE(service.IsLoaded());
	EXPECT_FALSE(service.CurrentFilePath());
	EXPECT_FALSE(service.Version());
}

TEST_F(ArchiveServiceTest, OpenArchiveRejectsBadPaths) {
	ArchiveService service(MakeExampleLibrary(), m_config);
	EXPECT_THROW(service.OpenArchive({}), std::invalid_argument);
	EXPECT_THROW(service.OpenArchive(m_dir / "absent.ggpk"), FileOperationException);
}

TEST_F(ArchiveServiceTest, OpenFailureIsReportedNotThrown) {
	const auto library = MakeExampleLibrary();
	library->Behavior = OpenBehavior::Throw;
	library->OpenFailure = "oo2core_8_win64.dll is missing";

	ArchiveService service(library, m_config);
	const auto subscription = CollectErrors(service);

	EXPECT_FALSE(service.OpenArchive(WriteFile("Content.ggpk", ArchiveHeader())));
	EXPECT_FALSE(service.IsLoaded());
	ASSERT_EQ(m_errors.size(), 1u);
	EXPECT_FALSE(m_errors[0].Recoverable);
	EXPECT_EQ(m_errors[0].Operation, "Opening GGPK file");
	try {
		std::rethrow_exception(m_errors[0].Error);
	} catch (const ArchiveOpenException& e) {
		EXPECT_EQ(e.Category(), ErrorCategory::BundleDecompression);
	}
}

TEST_F(ArchiveServiceTest, OperationsRequireLoadedArchive) {
	ArchiveService service(MakeExampleLibrary(), m_config);

	EXPECT_THROW(void(service.GetChildren("")), std::logic_error);
	EXPECT_THROW(void(service.GetNodeInfo("Data")), std::logic_error);
	EXPECT_THROW(void(service.ReadFile("Data/example.txt")), std::logic_error);
	EXPECT_THROW(void(service.GetRoot()), std::logic_error);
	EXPECT_THROW(void(service.ExtractDirectory("Data", m_dir / "out")), std::logic_error);
}

TEST_F(ArchiveServiceTest, ChildrenComeFromIndexWhenPresent) {
	const auto service = OpenService(MakeBundledLibrary());
	EXPECT_EQ(NamesOf(service->GetChildren("")), std::vector<std::string>{ "Art" });
	EXPECT_EQ(NamesOf(service->GetChildren("Art")), (std::vector<std::string>{ "2DArt", "logo.png" }));
}

TEST_F(ArchiveServiceTest, ChildrenComeFromRecordsWithoutIndex) {
	const auto service = OpenService(MakeExampleLibrary());
	const auto children = service->GetChildren("/Data");
	ASSERT_EQ(children.size(), 1u);
	EXPECT_EQ(children[0].FullPath(), "Data/example.txt");
}

TEST_F(ArchiveServiceTest, ChildrenFallBackToRecordsWhenIndexFails) {
	const auto library = MakeBundledLibrary();
	library->Index->RootNode->ChildrenFailure = "index truncated";
	const auto service = OpenService(library);
	const auto subscription = CollectErrors(*service);

	EXPECT_EQ(NamesOf(service->GetChildren("")), (std::vector<std::string>{ "Bundles2", "Readme.txt" }));
	ASSERT_EQ(m_errors.size(), 1u);
	EXPECT_TRUE(m_errors[0].Recoverable);
	EXPECT_THROW(std::rethrow_exception(m_errors[0].Error), BundleDecompressionException);
}

TEST_F(ArchiveServiceTest, RecordFailuresYieldEmptyChildren) {
	const auto library = MakeExampleLibrary();
	std::dynamic_pointer_cast<FakeDirectoryRecord>(library->RecordRoot->Entries[0])->ChildrenFailure = "sector unreadable";
	const auto service = OpenService(library);
	const auto subscription = CollectErrors(*service);

	EXPECT_TRUE(service->GetChildren("Data").empty());
	ASSERT_EQ(m_errors.size(), 1u);
	EXPECT_FALSE(m_errors[0].Recoverable);
}

TEST_F(ArchiveServiceTest, NodeInfoSearchesIndexThenRecords) {
	const auto service = OpenService(MakeBundledLibrary());

	const auto bundled = service->GetNodeInfo("Art/logo.png");
	ASSERT_TRUE(bundled);
	EXPECT_EQ(bundled->Type(), NodeType::BundleFile);

	const auto record = service->GetNodeInfo("readme.TXT");
	ASSERT_TRUE(record);
	EXPECT_EQ(record->Type(), NodeType::File);
	EXPECT_EQ(record->FullPath(), "Readme.txt");

	const auto directory = service->GetNodeInfo("Art/");
	ASSERT_TRUE(directory);
	EXPECT_TRUE(directory->IsDirectory());

	EXPECT_FALSE(service->GetNodeInfo("Art/logo.png/"));
	EXPECT_FALSE(service->GetNodeInfo("Readme.txt/"));
	EXPECT_TRUE(service->GetNodeInfo("/")->IsRoot());

	EXPECT_TRUE(service->Exists("Art/2DArt/icon.dds"));
	EXPECT_TRUE(service->Exists("Bundles2/_.index.bin"));
	EXPECT_FALSE(service->Exists("Audio"));
}

TEST_F(ArchiveServiceTest, FilePropertiesCarryArchiveMetadata) {
	const auto service = OpenService(MakeBundledLibrary());

	const auto properties = service->GetFileProperties("Art/2DArt/icon.dds");
	EXPECT_EQ(properties.Entry.Size(), 256u);
	EXPECT_EQ(properties.Metadata.value("GGPKVersion", 0u), 3u);
	EXPECT_TRUE(properties.Metadata.value("IsBundled", false));

	try {
		void(service->GetFileProperties("Audio/none.ogg"));
		FAIL() << "expected FileOperationException";
	} catch (const FileOperationException& e) {
		EXPECT_EQ(e.OperationType(), FileOperationType::GetProperties);
	}
}

TEST_F(ArchiveServiceTest, ReadFilePrefersIndex) {
	const auto service = OpenService(MakeBundledLibrary());

	EXPECT_EQ(service->ReadFile("Art/logo.png"), Bytes(48, 5));
	EXPECT_EQ(service->ReadFile("Readme.txt"), Bytes(32));
}

TEST_F(ArchiveServiceTest, ReadFileReportsMissingFiles) {
	const auto service = OpenService(MakeExampleLibrary());
	const auto subscription = CollectErrors(*service);

	try {
		void(service->ReadFile("Data/absent.txt"));
		FAIL() << "expected FileOperationException";
	} catch (const FileOperationException& e) {
		EXPECT_EQ(e.OperationType(), FileOperationType::Read);
		EXPECT_EQ(e.FilePath(), "Data/absent.txt");
	}
	EXPECT_EQ(m_errors.size(), 1u);
}

TEST_F(ArchiveServiceTest, ExtractFileWritesContent) {
	const auto service = OpenService(MakeExampleLibrary());
	const auto target = m_dir / "out" / "nested" / "example.txt";

	service->ExtractFile("Data/example.txt", target);
	EXPECT_EQ(ReadAll(target), Bytes(120));
}

TEST_F(ArchiveServiceTest, ExtractDirectoryKeepsRelativeLayout) {
	const auto service = OpenService(MakeBundledLibrary());
	const auto target = m_dir / "art";

	EXPECT_EQ(service->ExtractDirectory("Art/", target), 2u);
	EXPECT_EQ(ReadAll(target / "logo.png"), Bytes(48, 5));
	EXPECT_EQ(ReadAll(target / "2DArt" / "icon.dds"), Bytes(256, 3));
}

TEST_F(ArchiveServiceTest, ExtractRootSkipsBundleFolder) {
	const auto service = OpenService(MakeBundledLibrary());
	const auto target = m_dir / "all";

	EXPECT_EQ(service->ExtractDirectory("", target), 2u);
	EXPECT_TRUE(exists(target / "Art" / "logo.png"));
	EXPECT_FALSE(exists(target / "Bundles2"));
}

TEST_F(ArchiveServiceTest, ExtractDirectorySkipsFailingFiles) {
	const auto library = MakeBundledLibrary();
	std::dynamic_pointer_cast<FakeIndexFile>(library->Index->FindNode("Art/logo.png"))->ReadFailure = "bundle checksum mismatch";
	const auto service = OpenService(library);
	const auto target = m_dir / "partial";

	EXPECT_EQ(service->ExtractDirectory("Art", target), 1u);
	EXPECT_TRUE(exists(target / "2DArt" / "icon.dds"));
	EXPECT_FALSE(exists(target / "logo.png"));
}

TEST_F(ArchiveServiceTest, ExtractDirectoryFromIndexRequiresDirectory) {
	const auto service = OpenService(MakeBundledLibrary());
	const auto subscription = CollectErrors(*service);

	try {
		void(service->ExtractDirectory("Missing", m_dir / "missing"));
		FAIL() << "expected FileOperationException";
	} catch (const FileOperationException& e) {
		EXPECT_EQ(e.OperationType(), FileOperationType::Extract);
		EXPECT_EQ(e.FilePath(), "Missing");
	}
	EXPECT_THROW(void(service->ExtractDirectory("Art/logo.png", m_dir / "file")), FileOperationException);
	EXPECT_FALSE(exists(m_dir / "file"));
	EXPECT_EQ(m_errors.size(), 2u);
}

TEST_F(ArchiveServiceTest, ExtractDirectoryFromRecords) {
	const auto service = OpenService(MakeExampleLibrary());
	const auto subscription = CollectErrors(*service);

	EXPECT_EQ(service->ExtractDirectory("data", m_dir / "data"), 1u);
	EXPECT_EQ(ReadAll(m_dir / "data" / "example.txt"), Bytes(120));

	EXPECT_THROW(service->ExtractDirectory("Missing", m_dir / "missing"), FileOperationException);
	EXPECT_EQ(m_errors.size(), 1u);
}

TEST_F(ArchiveServiceTest, ValidationAcceptsWellFormedHeader) {
	ArchiveService service(MakeExampleLibrary(), m_config);
	const auto report = service.ValidateArchiveFile(WriteFile("Content.ggpk", ArchiveHeader()));
	EXPECT_TRUE(report.Valid);
	EXPECT_TRUE(report.CorruptionType.empty());
	EXPECT_EQ(report.Details.value("HeaderSignature", std::string()), "GGPK");
}

TEST_F(ArchiveServiceTest, ValidationRejectsBadFiles) {
	ArchiveService service(MakeExampleLibrary(), m_config);

	EXPECT_EQ(service.ValidateArchiveFile(m_dir / "absent.ggpk").CorruptionType, "FileNotFound");
	EXPECT_EQ(service.ValidateArchiveFile(WriteFile("small.ggpk", ArchiveHeader(1023))).CorruptionType, "InvalidFileSize");

	auto wrongTag = ArchiveHeader();
	wrongTag[4] = 'X';
	const auto report = service.ValidateArchiveFile(WriteFile("wrong.ggpk", wrongTag));
	EXPECT_FALSE(report.Valid);
	EXPECT_EQ(report.CorruptionType, "InvalidSignature");
	EXPECT_EQ(report.Error, "Invalid GGPK signature");
}

TEST_F(ArchiveServiceTest, ValidationSizeLimitIsConfigurable) {
	m_config->MinimumArchiveSize = 8;
	ArchiveService service(MakeExampleLibrary(), m_config);

	EXPECT_EQ(service.ValidateArchiveFile(WriteFile("tiny.ggpk", ArchiveHeader(12))).CorruptionType, "HeaderReadFailure");
	EXPECT_TRUE(service.ValidateArchiveFile(WriteFile("short.ggpk", ArchiveHeader(16))).Valid);
}

TEST_F(ArchiveServiceTest, ConvertsFailuresIntoTaxonomy) {
	ArchiveService service(MakeExampleLibrary(), m_config);

	const auto original = std::make_exception_ptr(GgpkException("already wrapped"));
	EXPECT_EQ(service.ToGgpkException(original, "x.ggpk", "Testing"), original);

	const auto convert = [&service](std::exception_ptr ep) {
		return service.ToGgpkException(ep, "/data/Content.ggpk", "Testing");
	};

	try {
		std::rethrow_exception(convert(std::make_exception_ptr(std::filesystem::filesystem_error("open", std::make_error_code(std::errc::no_such_file_or_directory)))));
	} catch (const FileOperationException& e) {
		EXPECT_STREQ(e.what(), "GGPK file not found: /data/Content.ggpk");
		EXPECT_FALSE(e.Context().value("IsGGPKLoaded", true));
	}

	try {
		std::rethrow_exception(convert(std::make_exception_ptr(std::filesystem::filesystem_error("open", std::make_error_code(std::errc::permission_denied)))));
	} catch (const FileOperationException& e) {
		EXPECT_EQ(std::string(e.what()).rfind("Access denied", 0), 0u);
	}

	try {
		std::rethrow_exception(convert(std::make_exception_ptr(std::runtime_error("bundle header is broken"))));
	} catch (const BundleDecompressionException& e) {
		EXPECT_EQ(e.BundleName(), "Content.ggpk");
	}

	try {
		std::rethrow_exception(convert(std::make_exception_ptr(std::runtime_error("data is corrupt"))));
	} catch (const CorruptDataException& e) {
		EXPECT_STREQ(e.what(), "Invalid data in GGPK file: data is corrupt");
		EXPECT_TRUE(e.Inner());
		EXPECT_EQ(e.RootMessage(), "data is corrupt");
		EXPECT_TRUE(e.Context().contains("ThreadId"));
		EXPECT_EQ(e.Context().value("Context", std::string()), "Testing");
		EXPECT_EQ(e.CorruptedOffset(), -1);
	}

	try {
		std::rethrow_exception(convert(std::make_exception_ptr(std::runtime_error("something odd"))));
	} catch (const FileOperationException&) {
		FAIL() << "unexpected FileOperationException";
	} catch (const GgpkException& e) {
		EXPECT_STREQ(e.what(), "Unexpected error in Testing: something odd");
		EXPECT_EQ(e.Context().value("OriginalExceptionType", std::string()), "std::runtime_error");
	}
}
