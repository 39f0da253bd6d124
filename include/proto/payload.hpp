#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gatt/status.hpp"
#include "gatt/types.hpp"

/*
WRITE:
caller payload {encoding, text | bytes}
  -> encode(payload)          // Utf8Text: text bytes, Hex: digit pairs -> bytes, Raw: as is
     -> adapter write(bytes)

READ / NOTIFY:
adapter bytes
  -> to_hex(bytes) / to_printable(bytes)   // presentation only, the caller chooses
*/

namespace payload
{

enum class Encoding
{
    Utf8Text,
    Hex,
    Raw
};

const char *encoding_name(Encoding e);
// "text" | "utf8" | "string" -> Utf8Text, "hex" -> Hex, "raw" | "bytes" -> Raw
bool        parse_encoding(std::string_view name, Encoding &out);

// Tagged payload: text for Utf8Text/Hex, bytes for Raw.
class Payload
{
  public:
    static Payload text(std::string s) { return Payload(Encoding::Utf8Text, std::move(s), {}); }
    static Payload hex(std::string s) { return Payload(Encoding::Hex, std::move(s), {}); }
    static Payload raw(gatt::Bytes b) { return Payload(Encoding::Raw, {}, std::move(b)); }

    Encoding           encoding() const { return enc_; }
    const std::string &text_value() const { return text_; }
    const gatt::Bytes &raw_value() const { return raw_; }

  private:
    Payload(Encoding e, std::string t, gatt::Bytes b)
        : enc_(e), text_(std::move(t)), raw_(std::move(b))
    {
    }

    Encoding    enc_;
    std::string text_;
    gatt::Bytes raw_;
};

// Build a payload from an encoding name and the operator's text (CLI / IPC input).
// Raw input is taken byte-for-byte from the text.
Payload from_text(Encoding e, std::string text);

gatt::Status encode(const Payload &p, gatt::Bytes &out);

// Accepts "48656c6c6f", "48 65 6c 6c 6f" and "48:65:6c:6c:6f".
gatt::Status hex_to_bytes(std::string_view hex, gatt::Bytes &out);
std::string  to_hex(const gatt::Bytes &bytes);
// Valid UTF-8 sequences and printable ASCII survive, everything else is dropped.
std::string  to_printable(const gatt::Bytes &bytes);

}  // namespace payload
