#include "Node.h"

#include "ErrorContext.h"

const char* GgpkRes::NodeTypeName(NodeType type) {
	switch (type) {
		case NodeType::Directory:
			return "Directory";
		case NodeType::File:
			return "File";
		case NodeType::BundleFile:
			return "BundleFile";
	}
	return "Unknown";
}

const char* GgpkRes::CompressionTypeName(CompressionType type) {
	switch (type) {
		case CompressionType::None:
			return "None";
		case CompressionType::Oodle:
			return "Oodle";
		case CompressionType::Other:
			return "Other";
	}
	return "Unknown";
}

GgpkRes::Node GgpkRes::Node::Directory(std::string name, std::string fullPath, bool hasChildren) {
	Node node;
	node.m_name = std::move(name);
	node.m_fullPath = std::move(fullPath);
	node.m_type = NodeType::Directory;
	node.m_hasChildren = hasChildren;
	return node;
}

GgpkRes::Node GgpkRes::Node::File(std::string name, std::string fullPath, uint64_t size) {
	Node node;
	node.m_name = std::move(name);
	node.m_fullPath = std::move(fullPath);
	node.m_type = NodeType::File;
	node.m_size = size;
	return node;
}

GgpkRes::Node GgpkRes::Node::BundleFile(std::string name, std::string fullPath, uint64_t size, std::optional<CompressionDescriptor> compression) {
	Node node;
	node.m_name = std::move(name);
	node.m_fullPath = std::move(fullPath);
	node.m_type = NodeType::BundleFile;
	node.m_size = size;
	node.m_compression = std::move(compression);
	return node;
}

GgpkRes::Node& GgpkRes::Node::WithHash(std::optional<std::string> hash) {
	m_hash = std::move(hash);
	return *this;
}

GgpkRes::Node& GgpkRes::Node::WithOffset(std::optional<int64_t> offset) {
	m_offset = offset;
	return *this;
}

GgpkRes::Node& GgpkRes::Node::WithModifiedTime(std::optional<std::chrono::system_clock::time_point> modifiedTime) {
	m_modifiedTime = modifiedTime;
	return *this;
}

void GgpkRes::to_json(nlohmann::json& j, const CompressionDescriptor& value) {
	j = nlohmann::json{
		{"Type", CompressionTypeName(value.Type)},
		{"CompressedSize", value.CompressedSize},
		{"UncompressedSize", value.UncompressedSize},
		{"Ratio", value.Ratio()},
	};
	if (!value.AdditionalInfo.empty())
		j["AdditionalInfo"] = value.AdditionalInfo;
}

void GgpkRes::to_json(nlohmann::json& j, const Node& value) {
	j = nlohmann::json{
		{"Name", value.Name()},
		{"FullPath", value.FullPath()},
		{"Type", NodeTypeName(value.Type())},
		{"Size", value.Size()},
		{"HasChildren", value.HasChildren()},
	};
	if (value.ModifiedTime())
		j["ModifiedTime"] = FormatUtcTimestamp(*value.ModifiedTime());
	if (value.Hash())
		j["Hash"] = *value.Hash();
	if (value.Offset())
		j["Offset"] = *value.Offset();
	if (value.Compression())
		j["Compression"] = *value.Compression();
}
