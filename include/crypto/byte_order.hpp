#ifndef PEERDROP_BYTE_ORDER_HPP
#define PEERDROP_BYTE_ORDER_HPP

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <boost/endian/conversion.hpp>

namespace peerdrop::crypto {

// Big endian (network order) reads and writes into raw byte buffers
class ByteOrder {
public:
    // Writes value as big endian into the first sizeof(T) bytes of out
    template<typename T>
    static void store_big(T value, uint8_t* out) {
        T big = boost::endian::native_to_big(value);
        std::memcpy(out, &big, sizeof(T));
    }

    // Reads a big endian value from the first sizeof(T) bytes of in
    template<typename T>
    static T load_big(const uint8_t* in) {
        T big;
        std::memcpy(&big, in, sizeof(T));
        return boost::endian::big_to_native(big);
    }

    // Bounds checked variant used when parsing untrusted frames
    template<typename T>
    static T load_big(const uint8_t* in, std::size_t available) {
        if (available < sizeof(T)) {
            throw std::out_of_range("ByteOrder: buffer too short");
        }
        return load_big<T>(in);
    }
};

} // namespace peerdrop::crypto

#endif // PEERDROP_BYTE_ORDER_HPP
