#ifndef _GGPKRES_TREESOURCE_H_
#define _GGPKRES_TREESOURCE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Backend.h"
#include "Node.h"

namespace GgpkRes {
	/// \brief One of the two structures an archive can be browsed through.
	/// Every path argument may use either separator and may carry a leading separator; "" and "/" mean the root.
	/// Implementations are not thread safe; ArchiveFacade serializes access to them.
	class TreeSource {
	public:
		virtual ~TreeSource() = default;

		[[nodiscard]] virtual Node Root() const = 0;

		/// \returns Node at path, or std::nullopt if nothing matches.
		[[nodiscard]] virtual std::optional<Node> Find(const std::string& path) const = 0;

		/// \returns Immediate children of the directory at path, or an empty vector if path does not name one.
		[[nodiscard]] virtual std::vector<Node> Children(const std::string& path) const = 0;

		/// \throws std::out_of_range if path does not name a file.
		[[nodiscard]] virtual std::vector<uint8_t> Read(const std::string& path) const = 0;
	};

	class RecordTreeSource : public TreeSource {
		const std::shared_ptr<Backend::DirectoryRecord> m_root;
		const bool m_verifyHash;

		struct Located {
			std::shared_ptr<Backend::Record> Record;
			std::string FullPath;
		};

		[[nodiscard]] std::optional<Located> Locate(const std::string& path) const;
		[[nodiscard]] Node Convert(const Backend::Record& record, std::string fullPath) const;

	public:
		RecordTreeSource(std::shared_ptr<Backend::DirectoryRecord> root, bool verifyHash);

		[[nodiscard]] Node Root() const override;
		[[nodiscard]] std::optional<Node> Find(const std::string& path) const override;
		[[nodiscard]] std::vector<Node> Children(const std::string& path) const override;
		[[nodiscard]] std::vector<uint8_t> Read(const std::string& path) const override;
	};

	class IndexTreeSource : public TreeSource {
		const std::shared_ptr<Backend::BundleIndex> m_index;
		const std::string m_bundleFolderName;

		[[nodiscard]] std::shared_ptr<Backend::IndexNode> Locate(const std::string& path) const;
		[[nodiscard]] static Node Convert(const Backend::IndexNode& node);

	public:
		/// \param bundleFolderName Name of the root-level folder hidden from listings, as its content is what the index describes.
		IndexTreeSource(std::shared_ptr<Backend::BundleIndex> index, std::string bundleFolderName);

		[[nodiscard]] Node Root() const override;
		[[nodiscard]] std::optional<Node> Find(const std::string& path) const override;
		[[nodiscard]] std::vector<Node> Children(const std::string& path) const override;
		[[nodiscard]] std::vector<uint8_t> Read(const std::string& path) const override;
	};
}

#endif
