#ifndef _GGPKRES_BACKEND_H_
#define _GGPKRES_BACKEND_H_

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Contracts an archive-reading library has to satisfy to be driven by GgpkRes.
// Parsing of the on-disk record format, bundle decompression and path hashing all live behind these interfaces.
namespace GgpkRes::Backend {
	using Sha256Hash = std::array<uint8_t, 32>;

	// Thrown by Library::OpenBundled when the archive has no bundle folder; the caller may retry as a plain archive.
	class MissingIndexDirectoryException : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Thrown by Library::OpenBundled when the bundle folder exists but holds no index.
	class MissingIndexFileException : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	class Record {
	public:
		virtual ~Record() = default;

		[[nodiscard]] virtual std::string Name() const = 0;
		[[nodiscard]] virtual std::optional<Sha256Hash> Hash() const = 0;
		[[nodiscard]] virtual std::optional<int64_t> Offset() const = 0;
	};

	class DirectoryRecord : public Record {
	public:
		[[nodiscard]] virtual std::vector<std::shared_ptr<Record>> Children() const = 0;
	};

	class FileRecord : public Record {
	public:
		[[nodiscard]] virtual uint64_t DataLength() const = 0;
		[[nodiscard]] virtual std::vector<uint8_t> Read() const = 0;
	};

	class IndexNode {
	public:
		virtual ~IndexNode() = default;

		[[nodiscard]] virtual std::string Name() const = 0;

		// Full path of this node inside the index, without a leading separator.
		[[nodiscard]] virtual std::string Path() const = 0;
	};

	class IndexDirectoryNode : public IndexNode {
	public:
		[[nodiscard]] virtual std::vector<std::shared_ptr<IndexNode>> Children() const = 0;
	};

	class IndexFileNode : public IndexNode {
	public:
		struct BundleReference {
			std::string BundlePath;

			// Decompressed size of this entry, when the library knows it without decompressing the bundle.
			std::optional<uint64_t> UncompressedSize;
		};

		// Size stored in the index record.
		[[nodiscard]] virtual uint64_t Size() const = 0;
		[[nodiscard]] virtual std::optional<BundleReference> Bundle() const = 0;

		// Decompresses the containing bundle as needed and returns this entry's bytes.
		[[nodiscard]] virtual std::vector<uint8_t> Read() const = 0;
	};

	class BundleIndex {
	public:
		virtual ~BundleIndex() = default;

		[[nodiscard]] virtual std::shared_ptr<IndexDirectoryNode> Root() const = 0;

		// Resolves a path without a leading separator; returns nullptr on a miss.
		[[nodiscard]] virtual std::shared_ptr<IndexNode> FindNode(const std::string& path) const = 0;
	};

	class Archive {
	public:
		virtual ~Archive() = default;

		[[nodiscard]] virtual std::shared_ptr<DirectoryRecord> Root() const = 0;
		[[nodiscard]] virtual uint32_t Version() const = 0;
	};

	class BundledArchive : public Archive {
	public:
		[[nodiscard]] virtual std::shared_ptr<BundleIndex> Index() const = 0;
	};

	class Library {
	public:
		virtual ~Library() = default;

		/// \brief Opens an archive together with its bundle index.
		/// \throws MissingIndexDirectoryException, MissingIndexFileException if the archive carries no usable index.
		[[nodiscard]] virtual std::unique_ptr<BundledArchive> OpenBundled(const std::filesystem::path& path) = 0;

		[[nodiscard]] virtual std::unique_ptr<Archive> OpenPlain(const std::filesystem::path& path) = 0;
	};
}

#endif
