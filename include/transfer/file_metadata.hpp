#ifndef PEERDROP_FILE_METADATA_HPP
#define PEERDROP_FILE_METADATA_HPP

#include <cstdint>
#include <string>

namespace peerdrop {
namespace transfer {

// Description of the file announced by the sender. Immutable once sent.
struct FileMetadata {
    static constexpr uint32_t CHUNK_SIZE = 16384;
    // Largest file a receiver accepts, and the chunk count that implies
    static constexpr uint64_t MAX_FILE_SIZE = uint64_t{1} << 40;
    static constexpr uint64_t MAX_CHUNKS = MAX_FILE_SIZE / CHUNK_SIZE;

    std::string filename;
    uint64_t size = 0;
    uint32_t chunk_size = CHUNK_SIZE;
    uint64_t total_chunks = 0;

    // total_chunks = ceil(size / chunk_size)
    static FileMetadata describe(const std::string& filename, uint64_t size,
                                 uint32_t chunk_size = CHUNK_SIZE);
    static uint64_t chunk_count(uint64_t size, uint32_t chunk_size);

    uint64_t chunk_offset(uint64_t index) const { return index * chunk_size; }
    // chunk_size for every chunk but the last, which holds the remainder
    std::size_t chunk_length(uint64_t index) const;

    // Receiver checks: 0 < chunk_size <= CHUNK_SIZE, size <= MAX_FILE_SIZE,
    // at most MAX_CHUNKS chunks, consistent chunk count, usable filename.
    // Throws ProtocolViolation.
    void validate() const;

    // {"filename":..,"size":..,"chunk_size":..,"total_chunks":..}
    std::string to_json() const;
    // Throws ProtocolViolation. The filename is reduced to its last component.
    static FileMetadata from_json(const std::string& text);

    // Last path component, "/" and "\" both count as separators
    static std::string sanitize_filename(const std::string& name);
};

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_FILE_METADATA_HPP
