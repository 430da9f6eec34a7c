#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace mapink {

//=============================================================================
// ByteWriter: little-endian append buffer
//=============================================================================
class ByteWriter {
public:
    void appendU8(uint8_t v) { _buf.push_back(v); }

    void appendU16(uint16_t v) {
        _buf.push_back(static_cast<uint8_t>(v & 0xFF));
        _buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }

    void appendU32(uint32_t v) {
        appendU16(static_cast<uint16_t>(v & 0xFFFF));
        appendU16(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }

    void appendI32(int32_t v) { appendU32(static_cast<uint32_t>(v)); }

    // Low width bytes of v, two's complement for negatives
    void appendSigned(int64_t v, size_t width) {
        auto u = static_cast<uint32_t>(static_cast<int32_t>(v));
        for (size_t i = 0; i < width; i++) {
            _buf.push_back(static_cast<uint8_t>((u >> (8 * i)) & 0xFF));
        }
    }

    void appendBytes(const void* data, size_t n) {
        auto p = static_cast<const uint8_t*>(data);
        _buf.insert(_buf.end(), p, p + n);
    }

    void appendString(std::string_view s) { appendBytes(s.data(), s.size()); }

    size_t size() const { return _buf.size(); }

    std::vector<uint8_t> take() { return std::move(_buf); }

private:
    std::vector<uint8_t> _buf;
};

//=============================================================================
// ByteCursor: bounds-checked little-endian reader
//
// A read past the end returns false and leaves the cursor exhausted; the
// caller stops and reports what it has.
//=============================================================================
class ByteCursor {
public:
    ByteCursor(const uint8_t* data, size_t size) : _data(data), _size(size) {}

    bool readU8(uint8_t& out) {
        if (!need(1)) return false;
        out = _data[_pos++];
        return true;
    }

    bool readU16(uint16_t& out) {
        if (!need(2)) return false;
        out = static_cast<uint16_t>(_data[_pos] | (_data[_pos + 1] << 8));
        _pos += 2;
        return true;
    }

    bool readU32(uint32_t& out) {
        if (!need(4)) return false;
        out = static_cast<uint32_t>(_data[_pos]) |
              (static_cast<uint32_t>(_data[_pos + 1]) << 8) |
              (static_cast<uint32_t>(_data[_pos + 2]) << 16) |
              (static_cast<uint32_t>(_data[_pos + 3]) << 24);
        _pos += 4;
        return true;
    }

    bool readI32(int32_t& out) {
        uint32_t u;
        if (!readU32(u)) return false;
        out = static_cast<int32_t>(u);
        return true;
    }

    // Sign-extended 1, 2 or 4 byte value
    bool readSigned(size_t width, int64_t& out) {
        if (width == 1) {
            uint8_t v;
            if (!readU8(v)) return false;
            out = static_cast<int8_t>(v);
        } else if (width == 2) {
            uint16_t v;
            if (!readU16(v)) return false;
            out = static_cast<int16_t>(v);
        } else {
            int32_t v;
            if (!readI32(v)) return false;
            out = v;
        }
        return true;
    }

    // Coordinate class width: 1 and 2 bytes unsigned, 4 bytes signed
    bool readCoord(size_t width, int64_t& out) {
        if (width == 1) {
            uint8_t v;
            if (!readU8(v)) return false;
            out = v;
        } else if (width == 2) {
            uint16_t v;
            if (!readU16(v)) return false;
            out = v;
        } else {
            int32_t v;
            if (!readI32(v)) return false;
            out = v;
        }
        return true;
    }

    bool readString(size_t n, std::string& out) {
        if (!need(n)) return false;
        out.assign(reinterpret_cast<const char*>(_data + _pos), n);
        _pos += n;
        return true;
    }

    bool readBytes(size_t n, const uint8_t*& out) {
        if (!need(n)) return false;
        out = _data + _pos;
        _pos += n;
        return true;
    }

    size_t position() const { return _pos; }
    size_t remaining() const { return _size - _pos; }
    bool exhausted() const { return _pos >= _size; }

private:
    bool need(size_t n) {
        if (_size - _pos < n) {
            _pos = _size;
            return false;
        }
        return true;
    }

    const uint8_t* _data;
    size_t _size;
    size_t _pos = 0;
};

} // namespace mapink
