#include "Common.h"
#include "ErrorContext.h"

#include <ctime>
#include <iomanip>
#include <new>
#include <sstream>
#include <system_error>
#include <thread>

#include "Internal/PathUtils.h"

const char* GgpkRes::ErrorCategoryName(ErrorCategory category) {
	switch (category) {
		case ErrorCategory::BundleDecompression:
			return "BundleDecompression";
		case ErrorCategory::FileAccess:
			return "FileAccess";
		case ErrorCategory::FileCorruption:
			return "FileCorruption";
		case ErrorCategory::Memory:
			return "Memory";
		case ErrorCategory::DirectoryTraversal:
			return "DirectoryTraversal";
		case ErrorCategory::Unknown:
		default:
			return "Unknown";
	}
}

const char* GgpkRes::SuggestedAction(ErrorCategory category) {
	switch (category) {
		case ErrorCategory::BundleDecompression:
			return "Check oo2core availability and bundle file integrity";
		case ErrorCategory::FileAccess:
			return "Check file permissions and ensure file is not locked";
		case ErrorCategory::FileCorruption:
			return "Verify GGPK file integrity and consider re-downloading";
		case ErrorCategory::Memory:
			return "File too large for available memory, try closing other applications";
		case ErrorCategory::DirectoryTraversal:
			return "Directory structure may be corrupted or inaccessible";
		case ErrorCategory::Unknown:
		default:
			return "Check system resources and file accessibility";
	}
}

const char* GgpkRes::FileOperationTypeName(FileOperationType type) {
	switch (type) {
		case FileOperationType::Read:
			return "Read";
		case FileOperationType::Extract:
			return "Extract";
		case FileOperationType::GetProperties:
			return "GetProperties";
		case FileOperationType::Search:
			return "Search";
	}
	return "Unknown";
}

std::string GgpkRes::GgpkException::RootMessage() const {
	std::string message = what();
	auto inner = m_inner;
	while (inner) {
		try {
			std::rethrow_exception(inner);
		} catch (const GgpkException& e) {
			message = e.what();
			inner = e.Inner();
		} catch (const std::exception& e) {
			message = e.what();
			inner = nullptr;
		} catch (...) {
			inner = nullptr;
		}
	}
	return message;
}

static GgpkRes::ErrorCategory ClassifyByMessage(const std::string& message) {
	using GgpkRes::Internal::ContainsIgnoreCase;
	if (ContainsIgnoreCase(message, "oo2core") || ContainsIgnoreCase(message, "decompression"))
		return GgpkRes::ErrorCategory::BundleDecompression;
	if (ContainsIgnoreCase(message, "access") || ContainsIgnoreCase(message, "permission"))
		return GgpkRes::ErrorCategory::FileAccess;
	if (ContainsIgnoreCase(message, "corrupt") || ContainsIgnoreCase(message, "invalid"))
		return GgpkRes::ErrorCategory::FileCorruption;
	return GgpkRes::ErrorCategory::Unknown;
}

GgpkRes::ErrorCategory GgpkRes::ClassifyOpenFailure(const std::exception_ptr& ep) {
	if (!ep)
		return ErrorCategory::Unknown;

	try {
		std::rethrow_exception(ep);
	} catch (const BundleDecompressionException&) {
		return ErrorCategory::BundleDecompression;
	} catch (const CorruptDataException&) {
		return ErrorCategory::FileCorruption;
	} catch (const std::filesystem::filesystem_error& e) {
		if (e.code() == std::errc::permission_denied || e.code() == std::errc::operation_not_permitted)
			return ErrorCategory::FileAccess;
		return ClassifyByMessage(e.what());
	} catch (const std::bad_alloc&) {
		return ErrorCategory::Memory;
	} catch (const std::exception& e) {
		return ClassifyByMessage(e.what());
	} catch (...) {
		return ErrorCategory::Unknown;
	}
}

GgpkRes::ErrorCategory GgpkRes::ClassifyReadFailure(const std::exception_ptr& ep) {
	if (!ep)
		return ErrorCategory::Unknown;

	try {
		std::rethrow_exception(ep);
	} catch (const std::bad_alloc&) {
		return ErrorCategory::Memory;
	} catch (const CorruptDataException&) {
		return ErrorCategory::FileCorruption;
	} catch (const BundleDecompressionException&) {
		return ErrorCategory::BundleDecompression;
	} catch (const std::exception& e) {
		using Internal::ContainsIgnoreCase;
		const std::string message = e.what();
		if (ContainsIgnoreCase(message, "memory"))
			return ErrorCategory::Memory;
		if (ContainsIgnoreCase(message, "corrupt") || ContainsIgnoreCase(message, "invalid"))
			return ErrorCategory::FileCorruption;
		if (ContainsIgnoreCase(message, "bundle") || ContainsIgnoreCase(message, "decompression"))
			return ErrorCategory::BundleDecompression;
		return ErrorCategory::Unknown;
	} catch (...) {
		return ErrorCategory::Unknown;
	}
}

std::string GgpkRes::DescribeException(const std::exception_ptr& ep) {
	if (!ep)
		return {};

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception& e) {
		return e.what();
	} catch (...) {
		return "Unrecognized exception";
	}
}

std::string GgpkRes::ExceptionTypeName(const std::exception_ptr& ep) {
	if (!ep)
		return {};

	try {
		std::rethrow_exception(ep);
	} catch (const ArchiveOpenException&) {
		return "ArchiveOpenException";
	} catch (const BundleDecompressionException&) {
		return "BundleDecompressionException";
	} catch (const FileOperationException&) {
		return "FileOperationException";
	} catch (const CorruptDataException&) {
		return "CorruptDataException";
	} catch (const GgpkException&) {
		return "GgpkException";
	} catch (const std::filesystem::filesystem_error&) {
		return "std::filesystem::filesystem_error";
	} catch (const std::bad_alloc&) {
		return "std::bad_alloc";
	} catch (const std::out_of_range&) {
		return "std::out_of_range";
	} catch (const std::invalid_argument&) {
		return "std::invalid_argument";
	} catch (const std::logic_error&) {
		return "std::logic_error";
	} catch (const std::runtime_error&) {
		return "std::runtime_error";
	} catch (const std::exception&) {
		return "std::exception";
	} catch (...) {
		return "unknown";
	}
}

std::string GgpkRes::CurrentThreadId() {
	std::ostringstream oss;
	oss << std::this_thread::get_id();
	return oss.str();
}

std::string GgpkRes::FormatUtcTimestamp(std::chrono::system_clock::time_point tp) {
	const auto t = std::chrono::system_clock::to_time_t(tp);
	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
	std::tm tm{};
#ifdef _WIN32
	gmtime_s(&tm, &t);
#else
	gmtime_r(&t, &tm);
#endif

	std::ostringstream oss;
	oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
	return oss.str();
}

nlohmann::json GgpkRes::MakeErrorContext(const std::exception_ptr& ep, ErrorCategory category) {
	return nlohmann::json{
		{"Error", DescribeException(ep)},
		{"ExceptionType", ExceptionTypeName(ep)},
		{"ThreadId", CurrentThreadId()},
		{"Timestamp", FormatUtcTimestamp(std::chrono::system_clock::now())},
		{"ErrorCategory", ErrorCategoryName(category)},
		{"SuggestedAction", SuggestedAction(category)},
	};
}

void GgpkRes::AddFileSystemContext(nlohmann::json& context, const std::filesystem::path& path) {
	std::error_code ec;
	const auto exists = std::filesystem::exists(path, ec);
	context["FileExists"] = exists && !ec;
	if (!exists || ec)
		return;

	if (const auto size = std::filesystem::file_size(path, ec); !ec)
		context["FileSize"] = size;
	else
		context["FileInfoError"] = ec.message();

	if (const auto modified = std::filesystem::last_write_time(path, ec); !ec)
		context["LastModified"] = FormatUtcTimestamp(std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(modified)));

	const auto parent = path.parent_path();
	context["DirectoryExists"] = parent.empty() || std::filesystem::is_directory(parent, ec);
}
