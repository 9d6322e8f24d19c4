#include "transfer/file_metadata.hpp"
#include "transfer/transfer_error.hpp"
#include <nlohmann/json.hpp>

namespace peerdrop {
namespace transfer {

using json = nlohmann::json;

FileMetadata FileMetadata::describe(const std::string& filename, uint64_t size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw TransferError("chunk size must be positive");
    }
    FileMetadata metadata;
    metadata.filename = filename;
    metadata.size = size;
    metadata.chunk_size = chunk_size;
    metadata.total_chunks = chunk_count(size, chunk_size);
    return metadata;
}

uint64_t FileMetadata::chunk_count(uint64_t size, uint32_t chunk_size) {
    return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}

std::size_t FileMetadata::chunk_length(uint64_t index) const {
    if (index >= total_chunks) {
        return 0;
    }
    const uint64_t remaining = size - chunk_offset(index);
    return static_cast<std::size_t>(remaining < chunk_size ? remaining : chunk_size);
}

void FileMetadata::validate() const {
    if (chunk_size == 0 || chunk_size > CHUNK_SIZE) {
        throw ProtocolViolation("chunk size " + std::to_string(chunk_size) + " outside 1.." +
                                std::to_string(CHUNK_SIZE));
    }
    if (size > MAX_FILE_SIZE) {
        throw ProtocolViolation("file size " + std::to_string(size) + " exceeds " +
                                std::to_string(MAX_FILE_SIZE) + " bytes");
    }
    if (total_chunks > MAX_CHUNKS) {
        throw ProtocolViolation("total_chunks " + std::to_string(total_chunks) + " exceeds " +
                                std::to_string(MAX_CHUNKS));
    }
    if (total_chunks != chunk_count(size, chunk_size)) {
        throw ProtocolViolation("total_chunks " + std::to_string(total_chunks) + " does not match size " +
                                std::to_string(size));
    }
    if (filename.empty() || filename == "." || filename == ".." ||
        filename != sanitize_filename(filename)) {
        throw ProtocolViolation("unusable filename '" + filename + "'");
    }
}

std::string FileMetadata::to_json() const {
    const json object = {
        {"filename", filename},
        {"size", size},
        {"chunk_size", chunk_size},
        {"total_chunks", total_chunks}
    };
    return object.dump();
}

FileMetadata FileMetadata::from_json(const std::string& text) {
    try {
        const json object = json::parse(text);
        if (!object.is_object() ||
            !object.contains("filename") || !object["filename"].is_string() ||
            !object.contains("size") || !object["size"].is_number_unsigned() ||
            !object.contains("chunk_size") || !object["chunk_size"].is_number_unsigned() ||
            !object.contains("total_chunks") || !object["total_chunks"].is_number_unsigned()) {
            throw ProtocolViolation("file metadata is missing fields");
        }

        const uint64_t chunk_size = object["chunk_size"].get<uint64_t>();
        if (chunk_size > UINT32_MAX) {
            throw ProtocolViolation("chunk size out of range");
        }

        FileMetadata metadata;
        metadata.filename = sanitize_filename(object["filename"].get<std::string>());
        metadata.size = object["size"].get<uint64_t>();
        metadata.chunk_size = static_cast<uint32_t>(chunk_size);
        metadata.total_chunks = object["total_chunks"].get<uint64_t>();
        return metadata;
    } catch (const json::exception& e) {
        throw ProtocolViolation(std::string("file metadata is not valid JSON: ") + e.what());
    }
}

std::string FileMetadata::sanitize_filename(const std::string& name) {
    const auto separator = name.find_last_of("/\\");
    return separator == std::string::npos ? name : name.substr(separator + 1);
}

} // namespace transfer
} // namespace peerdrop
