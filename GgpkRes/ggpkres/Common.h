#ifndef _GGPKRES_COMMON_H_
#define _GGPKRES_COMMON_H_

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace GgpkRes {
	// Default name of the folder inside a bundled archive that holds the bundle payloads.
	static constexpr const char* DefaultBundleFolderName = "Bundles2";

	// Default name of the compressed index that lives inside the bundle folder.
	static constexpr const char* DefaultIndexFileName = "_.index.bin";

	enum class ErrorCategory {
		Unknown,
		BundleDecompression,
		FileAccess,
		FileCorruption,
		Memory,
		DirectoryTraversal,
	};

	enum class FileOperationType {
		Read,
		Extract,
		GetProperties,
		Search,
	};

	[[nodiscard]] const char* ErrorCategoryName(ErrorCategory category);
	[[nodiscard]] const char* SuggestedAction(ErrorCategory category);
	[[nodiscard]] const char* FileOperationTypeName(FileOperationType type);

	class GgpkException : public std::runtime_error {
		nlohmann::json m_context;
		std::exception_ptr m_inner;

	public:
		explicit GgpkException(const std::string& message, nlohmann::json context = nlohmann::json::object(), std::exception_ptr inner = nullptr)
			: std::runtime_error(message)
			, m_context(std::move(context))
			, m_inner(std::move(inner)) {
		}

		[[nodiscard]] const nlohmann::json& Context() const {
			return m_context;
		}

		/// \brief The exception that caused this one, or nullptr.
		[[nodiscard]] const std::exception_ptr& Inner() const {
			return m_inner;
		}

		/// \brief what() of the innermost wrapped exception, or of this one if nothing is wrapped.
		[[nodiscard]] std::string RootMessage() const;
	};

	class CorruptDataException : public GgpkException {
	public:
		explicit CorruptDataException(const std::string& message, int64_t offset = -1)
			: GgpkException(message, nlohmann::json{ {"CorruptedOffset", offset} }) {
		}

		CorruptDataException(const std::string& message, int64_t offset, nlohmann::json context, std::exception_ptr inner)
			: GgpkException(message, WithOffset(std::move(context), offset), std::move(inner)) {
		}

		[[nodiscard]] int64_t CorruptedOffset() const {
			return Context().value("CorruptedOffset", int64_t{ -1 });
		}

	private:
		static nlohmann::json WithOffset(nlohmann::json context, int64_t offset) {
			if (!context.is_object())
				context = nlohmann::json::object();
			context["CorruptedOffset"] = offset;
			return context;
		}
	};

	class ArchiveOpenException : public GgpkException {
		ErrorCategory m_category;

	public:
		ArchiveOpenException(const std::string& message, ErrorCategory category, nlohmann::json context, std::exception_ptr inner)
			: GgpkException(message, std::move(context), std::move(inner))
			, m_category(category) {
		}

		[[nodiscard]] ErrorCategory Category() const {
			return m_category;
		}

		[[nodiscard]] const char* SuggestedAction() const {
			return GgpkRes::SuggestedAction(m_category);
		}
	};

	class BundleDecompressionException : public GgpkException {
		std::string m_bundleName;

	public:
		BundleDecompressionException(std::string bundleName, const std::string& message, std::exception_ptr inner = nullptr, nlohmann::json context = nlohmann::json::object())
			: GgpkException(message, std::move(context), std::move(inner))
			, m_bundleName(std::move(bundleName)) {
		}

		[[nodiscard]] const std::string& BundleName() const {
			return m_bundleName;
		}
	};

	class FileOperationException : public GgpkException {
		std::string m_filePath;
		FileOperationType m_operationType;

	public:
		FileOperationException(std::string filePath, FileOperationType operationType, const std::string& message, std::exception_ptr inner = nullptr, nlohmann::json context = nlohmann::json::object())
			: GgpkException(message, std::move(context), std::move(inner))
			, m_filePath(std::move(filePath))
			, m_operationType(operationType) {
		}

		[[nodiscard]] const std::string& FilePath() const {
			return m_filePath;
		}

		[[nodiscard]] FileOperationType OperationType() const {
			return m_operationType;
		}
	};
}

#endif
