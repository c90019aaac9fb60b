#include "TreeSource.h"

#include <algorithm>

#include "Common.h"
#include "Internal/PathUtils.h"
#include "Internal/Sha256.h"

GgpkRes::RecordTreeSource::RecordTreeSource(std::shared_ptr<Backend::DirectoryRecord> root, bool verifyHash)
	: m_root(std::move(root))
	, m_verifyHash(verifyHash) {
	if (!m_root)
		throw CorruptDataException("Archive has no root directory record");
}

std::optional<GgpkRes::RecordTreeSource::Located> GgpkRes::RecordTreeSource::Locate(const std::string& path) const {
	Located current{ m_root, std::string() };
	for (const auto& part : Internal::SplitPath(path)) {
		const auto dir = std::dynamic_pointer_cast<Backend::DirectoryRecord>(current.Record);
		if (!dir)
			return std::nullopt;

		const auto children = dir->Children();
		const auto it = std::find_if(children.begin(), children.end(), [&part](const auto& child) {
			return child && Internal::EqualsIgnoreCase(child->Name(), part);
		});
		if (it == children.end())
			return std::nullopt;

		current.FullPath = Internal::JoinPath(current.FullPath, (*it)->Name());
		current.Record = *it;
	}
	return current;
}

GgpkRes::Node GgpkRes::RecordTreeSource::Convert(const Backend::Record& record, std::string fullPath) const {
	auto name = fullPath.empty() ? std::string() : record.Name();

	std::optional<std::string> hash;
	if (const auto h = record.Hash())
		hash = Internal::ToHexString(*h);

	if (const auto dir = dynamic_cast<const Backend::DirectoryRecord*>(&record)) {
		return Node::Directory(std::move(name), std::move(fullPath), !dir->Children().empty())
			.WithHash(std::move(hash))
			.WithOffset(record.Offset());
	}

	if (const auto file = dynamic_cast<const Backend::FileRecord*>(&record)) {
		return Node::File(std::move(name), std::move(fullPath), file->DataLength())
			.WithHash(std::move(hash))
			.WithOffset(record.Offset());
	}

	throw CorruptDataException("Record " + fullPath + " is neither a directory nor a file", record.Offset().value_or(-1));
}

GgpkRes::Node GgpkRes::RecordTreeSource::Root() const {
	return Convert(*m_root, std::string());
}

std::optional<GgpkRes::Node> GgpkRes::RecordTreeSource::Find(const std::string& path) const {
	auto located = Locate(path);
	if (!located)
		return std::nullopt;
	return Convert(*located->Record, std::move(located->FullPath));
}

std::vector<GgpkRes::Node> GgpkRes::RecordTreeSource::Children(const std::string& path) const {
	const auto located = Locate(path);
	if (!located)
		return {};

	const auto dir = std::dynamic_pointer_cast<Backend::DirectoryRecord>(located->Record);
	if (!dir)
		return {};

	std::vector<Node> result;
	for (const auto& child : dir->Children()) {
		if (!child)
			continue;
		result.emplace_back(Convert(*child, Internal::JoinPath(located->FullPath, child->Name())));
	}
	return result;
}

std::vector<uint8_t> GgpkRes::RecordTreeSource::Read(const std::string& path) const {
	const auto located = Locate(path);
	const auto file = located ? std::dynamic_pointer_cast<Backend::FileRecord>(located->Record) : nullptr;
	if (!file)
		throw std::out_of_range("File not found: " + Internal::NormalizePath(path));

	auto data = file->Read();
	if (data.size() != file->DataLength())
		throw CorruptDataException("Read " + std::to_string(data.size()) + " bytes from " + located->FullPath + ", expected " + std::to_string(file->DataLength()), file->Offset().value_or(-1));

	// An all-zero hash marks a record whose hash was never computed.
	if (const auto hash = file->Hash(); m_verifyHash && hash && std::any_of(hash->begin(), hash->end(), [](uint8_t b) { return b != 0; }))
		Internal::VerifySha256(data, *hash, located->FullPath);

	return data;
}

GgpkRes::IndexTreeSource::IndexTreeSource(std::shared_ptr<Backend::BundleIndex> index, std::string bundleFolderName)
	: m_index(std::move(index))
	, m_bundleFolderName(std::move(bundleFolderName)) {
	if (!m_index)
		throw std::invalid_argument("index must not be null");
}

std::shared_ptr<GgpkRes::Backend::IndexNode> GgpkRes::IndexTreeSource::Locate(const std::string& path) const {
	if (Internal::IsRootPath(path))
		return m_index->Root();
	return m_index->FindNode(Internal::NormalizePath(path));
}

GgpkRes::Node GgpkRes::IndexTreeSource::Convert(const Backend::IndexNode& node) {
	auto fullPath = Internal::NormalizePath(node.Path());

	if (const auto dir = dynamic_cast<const Backend::IndexDirectoryNode*>(&node))
		return Node::Directory(fullPath.empty() ? std::string() : node.Name(), std::move(fullPath), !dir->Children().empty());

	if (const auto file = dynamic_cast<const Backend::IndexFileNode*>(&node)) {
		const auto size = file->Size();
		std::optional<CompressionDescriptor> compression;
		if (const auto bundle = file->Bundle()) {
			compression = CompressionDescriptor{
				.Type = CompressionType::Oodle,
				.CompressedSize = size,
				.UncompressedSize = bundle->UncompressedSize.value_or(size),
				.AdditionalInfo = "Bundle: " + bundle->BundlePath,
			};
		}
		return Node::BundleFile(node.Name(), std::move(fullPath), size, std::move(compression));
	}

	throw CorruptDataException("Index node " + node.Path() + " is neither a directory nor a file");
}

GgpkRes::Node GgpkRes::IndexTreeSource::Root() const {
	const auto root = m_index->Root();
	return Node::Directory(std::string(), std::string(), root && !root->Children().empty());
}

std::optional<GgpkRes::Node> GgpkRes::IndexTreeSource::Find(const std::string& path) const {
	if (Internal::IsRootPath(path))
		return Root();

	const auto node = Locate(path);
	if (!node)
		return std::nullopt;
	return Convert(*node);
}

std::vector<GgpkRes::Node> GgpkRes::IndexTreeSource::Children(const std::string& path) const {
	const auto node = Locate(path);
	if (!node)
		return {};

	if (const auto file = std::dynamic_pointer_cast<Backend::IndexFileNode>(node))
		return { Convert(*file) };

	const auto dir = std::dynamic_pointer_cast<Backend::IndexDirectoryNode>(node);
	if (!dir)
		return {};

	const auto isRoot = Internal::IsRootPath(path);
	std::vector<Node> result;
	for (const auto& child : dir->Children()) {
		if (!child)
			continue;
		if (isRoot && Internal::EqualsIgnoreCase(child->Name(), m_bundleFolderName))
			continue;
		result.emplace_back(Convert(*child));
	}
	return result;
}

std::vector<uint8_t> GgpkRes::IndexTreeSource::Read(const std::string& path) const {
	const auto file = std::dynamic_pointer_cast<Backend::IndexFileNode>(Locate(path));
	if (!file)
		throw std::out_of_range("File not found in index: " + Internal::NormalizePath(path));
	return file->Read();
}
