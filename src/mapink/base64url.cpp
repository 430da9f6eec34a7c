#include <mapink/base64url.h>

#include <array>

namespace mapink {

namespace {

constexpr char BASE64URL_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::array<int8_t, 256> makeDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 64; i++) {
        table[static_cast<uint8_t>(BASE64URL_CHARS[i])] = static_cast<int8_t>(i);
    }
    table[static_cast<uint8_t>('+')] = 62;
    table[static_cast<uint8_t>('/')] = 63;
    return table;
}

constexpr auto DECODE_TABLE = makeDecodeTable();

} // namespace

std::string base64UrlEncode(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < size) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        result.push_back(BASE64URL_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(triple >> 12) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(triple >> 6) & 0x3F]);
        result.push_back(BASE64URL_CHARS[triple & 0x3F]);
        i += 3;
    }

    if (i + 1 == size) {
        uint32_t val = data[i] << 16;
        result.push_back(BASE64URL_CHARS[(val >> 18) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(val >> 12) & 0x3F]);
    } else if (i + 2 == size) {
        uint32_t val = (data[i] << 16) | (data[i + 1] << 8);
        result.push_back(BASE64URL_CHARS[(val >> 18) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(val >> 12) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(val >> 6) & 0x3F]);
    }

    return result;
}

std::string base64UrlEncode(const std::vector<uint8_t>& bytes) {
    return base64UrlEncode(bytes.data(), bytes.size());
}

Result<std::vector<uint8_t>> base64UrlDecode(std::string_view text) {
    // Padding is implied by the length
    size_t len = text.size();
    while (len > 0 && text[len - 1] == '=') {
        --len;
    }
    if (len % 4 == 1) {
        return Err<std::vector<uint8_t>>("base64UrlDecode: invalid length " +
                                         std::to_string(text.size()));
    }

    std::vector<uint8_t> result;
    result.reserve(len * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; i++) {
        int8_t v = DECODE_TABLE[static_cast<uint8_t>(text[i])];
        if (v < 0) {
            return Err<std::vector<uint8_t>>("base64UrlDecode: invalid character at offset " +
                                             std::to_string(i));
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    return Ok(std::move(result));
}

} // namespace mapink
