//=============================================================================
// Base64URL transport tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <mapink/base64url.h>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace mapink;

suite base64url_tests = [] {
    "encodes without padding in url alphabet"_test = [] {
        std::vector<uint8_t> bytes = {0xFB, 0xFF};
        expect(base64UrlEncode(bytes) == "-_8");

        std::vector<uint8_t> man = {'M', 'a', 'n'};
        expect(base64UrlEncode(man) == "TWFu");

        std::vector<uint8_t> one = {'M'};
        expect(base64UrlEncode(one) == "TQ");
    };

    "empty input gives empty text"_test = [] {
        expect(base64UrlEncode(std::vector<uint8_t>{}).empty());
        auto decoded = base64UrlDecode("");
        expect(decoded.has_value() >> fatal);
        expect(decoded->empty());
    };

    "decodes url and standard alphabets"_test = [] {
        std::vector<uint8_t> expected = {0xFB, 0xFF};
        auto url = base64UrlDecode("-_8");
        auto standard = base64UrlDecode("+/8=");
        expect(url.has_value() >> fatal);
        expect(standard.has_value() >> fatal);
        expect(*url == expected);
        expect(*standard == expected);
    };

    "round trip covers every byte value"_test = [] {
        std::vector<uint8_t> bytes;
        for (int i = 0; i < 256; i++) bytes.push_back(static_cast<uint8_t>(i));
        for (size_t len = 0; len <= bytes.size(); len += 37) {
            std::vector<uint8_t> slice(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(len));
            auto text = base64UrlEncode(slice);
            expect(text.find_first_of("+/=") == std::string::npos);
            auto decoded = base64UrlDecode(text);
            expect(decoded.has_value() >> fatal);
            expect(*decoded == slice) << "length" << len;
        }
    };

    "remainder of one is rejected"_test = [] {
        expect(!base64UrlDecode("abcde").has_value());
        expect(!base64UrlDecode("a").has_value());
    };

    "foreign characters are rejected"_test = [] {
        expect(!base64UrlDecode("ab$d").has_value());
        expect(!base64UrlDecode("ab d").has_value());
        expect(!base64UrlDecode("a=bc").has_value());
    };
};
