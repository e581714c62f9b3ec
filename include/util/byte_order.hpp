#ifndef DATASTORE_BYTE_ORDER_HPP
#define DATASTORE_BYTE_ORDER_HPP

#include <cstdint>
#include <array>
#include <algorithm>
#include <cstring>
#include <istream>
#include <ostream>
#include <type_traits>

namespace datastore::util {

class ByteOrder {
public:
    // Detects if system is little endian
    static bool isLittleEndian() {
        static const uint16_t value = 0x0001;
        return *reinterpret_cast<const uint8_t*>(&value) == 0x01;
    }

    // Converts host byte order to network byte order (big endian)
    template<typename T>
    static T toNetworkOrder(T value) {
        if (isLittleEndian()) {
            return byteSwap(value);
        }
        return value;
    }

    // Converts network byte order (big endian) back to host byte order
    template<typename T>
    static T fromNetworkOrder(T value) {
        if (isLittleEndian()) {
            return byteSwap(value);
        }
        return value;
    }

    // Writes an integer to the stream in network byte order
    template<typename T>
    static void write(std::ostream& output, T value) {
        static_assert(std::is_integral<T>::value, "ByteOrder::write requires an integral type");
        T network = toNetworkOrder(value);
        output.write(reinterpret_cast<const char*>(&network), sizeof(T));
    }

    // Reads a network byte order integer; returns false on a short read
    template<typename T>
    static bool read(std::istream& input, T& value) {
        static_assert(std::is_integral<T>::value, "ByteOrder::read requires an integral type");
        T network;
        if (!input.read(reinterpret_cast<char*>(&network), sizeof(T))) {
            return false;
        }
        value = fromNetworkOrder(network);
        return true;
    }

private:
    // Generic byte swap implementation that works for any size T
    template<typename T>
    static T byteSwap(T value) {
        std::array<uint8_t, sizeof(T)> bytes;
        std::memcpy(bytes.data(), &value, sizeof(T));
        std::reverse(bytes.begin(), bytes.end());
        T result;
        std::memcpy(&result, bytes.data(), sizeof(T));
        return result;
    }
};

} // namespace datastore::util

#endif // DATASTORE_BYTE_ORDER_HPP
