#include <cctype>
#include <cstdint>
#include <sodium.h>
#include <string>
#include <string_view>
#include <vector>

#include "proto/payload.hpp"

namespace payload
{

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

const char *encoding_name(Encoding e)
{
    switch (e)
    {
        case Encoding::Utf8Text:
            return "text";
        case Encoding::Hex:
            return "hex";
        case Encoding::Raw:
            return "raw";
    }
    return "?";
}

bool parse_encoding(std::string_view name, Encoding &out)
{
    std::string n(name);
    for (auto &c : n)
        c = (char)std::tolower((unsigned char)c);
    if (n == "text" || n == "utf8" || n == "utf-8" || n == "string")
        out = Encoding::Utf8Text;
    else if (n == "hex")
        out = Encoding::Hex;
    else if (n == "raw" || n == "bytes")
        out = Encoding::Raw;
    else
        return false;
    return true;
}

Payload from_text(Encoding e, std::string text)
{
    switch (e)
    {
        case Encoding::Hex:
            return Payload::hex(std::move(text));
        case Encoding::Raw:
            return Payload::raw(gatt::Bytes(text.begin(), text.end()));
        case Encoding::Utf8Text:
            break;
    }
    return Payload::text(std::move(text));
}

gatt::Status hex_to_bytes(std::string_view hex, gatt::Bytes &out)
{
    // trim surrounding whitespace
    auto l = hex.find_first_not_of(" \t\r\n");
    if (l == std::string_view::npos)
    {
        out.clear();
        return gatt::Status::Ok();
    }
    auto r = hex.find_last_not_of(" \t\r\n");
    hex    = hex.substr(l, r - l + 1);

    // separators are only legal between complete byte pairs
    std::size_t digits = 0;
    for (std::size_t i = 0; i < hex.size(); ++i)
    {
        const unsigned char c = (unsigned char)hex[i];
        if (std::isxdigit(c))
        {
            ++digits;
            continue;
        }
        if ((c == ' ' || c == ':') && digits % 2 == 0)
            continue;
        return {gatt::Errc::MalformedPayload,
                "invalid hex character '" + std::string(1, (char)c) + "' at offset " +
                    std::to_string(i)};
    }
    if (digits % 2 != 0)
        return {gatt::Errc::MalformedPayload,
                "hex payload has an odd number of digits (" + std::to_string(digits) + ")"};

    ensure_sodium_init();
    out.assign(digits / 2, 0);
    std::size_t bin_len = 0;
    const char *end     = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), " :", &bin_len, &end) !=
            0 ||
        end != hex.data() + hex.size() || bin_len != out.size())
    {
        out.clear();
        return {gatt::Errc::MalformedPayload, "hex payload could not be decoded"};
    }
    return gatt::Status::Ok();
}

gatt::Status encode(const Payload &p, gatt::Bytes &out)
{
    switch (p.encoding())
    {
        case Encoding::Utf8Text:
            out.assign(p.text_value().begin(), p.text_value().end());
            return gatt::Status::Ok();
        case Encoding::Hex:
            return hex_to_bytes(p.text_value(), out);
        case Encoding::Raw:
            out = p.raw_value();
            return gatt::Status::Ok();
    }
    return {gatt::Errc::MalformedPayload, "unsupported payload encoding"};
}

std::string to_hex(const gatt::Bytes &bytes)
{
    if (bytes.empty())
        return std::string();
    ensure_sodium_init();
    std::string out(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
    out.pop_back();  // trailing NUL
    return out;
}

// Length of the UTF-8 sequence starting at i, or 0 if it is not well formed.
static std::size_t utf8_seq_len(const gatt::Bytes &b, std::size_t i)
{
    const std::uint8_t c = b[i];
    std::size_t        n = 0;
    if (c >= 0xC2 && c <= 0xDF)
        n = 2;
    else if (c >= 0xE0 && c <= 0xEF)
        n = 3;
    else if (c >= 0xF0 && c <= 0xF4)
        n = 4;
    else
        return 0;
    if (i + n > b.size())
        return 0;
    for (std::size_t k = 1; k < n; ++k)
    {
        if ((b[i + k] & 0xC0) != 0x80)
            return 0;
    }
    return n;
}

std::string to_printable(const gatt::Bytes &bytes)
{
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size())
    {
        const std::uint8_t c = bytes[i];
        if (c < 0x80)
        {
            if (std::isprint(c) || c == ' ')
                out.push_back((char)c);
            ++i;
            continue;
        }
        const std::size_t n = utf8_seq_len(bytes, i);
        if (n == 0)
        {
            ++i;  // drop invalid byte
            continue;
        }
        out.append(reinterpret_cast<const char *>(bytes.data() + i), n);
        i += n;
    }
    return out;
}

}  // namespace payload
