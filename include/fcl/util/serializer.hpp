#pragma once

#include <cstdint>
#include <cstring>
#include <utility>
#include <optional>
#include <string>

namespace fcl {

/**
 * BinaryWriter - Little helper for building record-log payloads.
 *
 * Integers are written in host byte order; strings are length-prefixed
 * with a uint32.
 */
class BinaryWriter {
public:
    void write_uint8(uint8_t v) {
        buffer_.push_back(static_cast<char>(v));
    }

    void write_uint32(uint32_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_uint64(uint64_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_int64(int64_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_string(const std::string& s) {
        write_uint32(static_cast<uint32_t>(s.size()));
        buffer_.append(s);
    }

    // Presence flag followed by the string when present
    void write_optional_string(const std::optional<std::string>& s) {
        write_uint8(s.has_value() ? 1 : 0);
        if (s.has_value()) {
            write_string(*s);
        }
    }

    std::string release() { return std::move(buffer_); }

private:
    std::string buffer_;
};

/**
 * BinaryReader - Bounds-checked counterpart of BinaryWriter.
 *
 * Every read returns false once the buffer runs short, leaving the
 * output untouched.
 */
class BinaryReader {
public:
    explicit BinaryReader(const std::string& data)
        : ptr_(data.data())
        , end_(data.data() + data.size())
    {}

    bool has_remaining(size_t size) const {
        return static_cast<size_t>(end_ - ptr_) >= size;
    }

    bool read_uint8(uint8_t* v) {
        if (!has_remaining(sizeof(*v))) return false;
        *v = static_cast<uint8_t>(*ptr_);
        ptr_ += sizeof(*v);
        return true;
    }

    bool read_uint32(uint32_t* v) {
        return read_fixed(v);
    }

    bool read_uint64(uint64_t* v) {
        return read_fixed(v);
    }

    bool read_int64(int64_t* v) {
        return read_fixed(v);
    }

    bool read_string(std::string* s) {
        uint32_t len;
        if (!read_uint32(&len)) return false;
        if (!has_remaining(len)) return false;
        s->assign(ptr_, len);
        ptr_ += len;
        return true;
    }

    bool read_optional_string(std::optional<std::string>* s) {
        uint8_t present = 0;
        if (!read_uint8(&present)) return false;
        if (present == 0) {
            s->reset();
            return true;
        }
        std::string value;
        if (!read_string(&value)) return false;
        *s = std::move(value);
        return true;
    }

private:
    template<typename T>
    bool read_fixed(T* v) {
        if (!has_remaining(sizeof(T))) return false;
        std::memcpy(v, ptr_, sizeof(T));
        ptr_ += sizeof(T);
        return true;
    }

    const char* ptr_;
    const char* end_;
};

}  // namespace fcl
