#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace aax::codec {

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// AAX key/iv pair. Only constructible through parse(), so holding one means
// both halves decoded to non-empty byte strings.
class EncryptionMaterial {
public:
    // Accepts hex with optional "0x" prefix and ' ', ':' or '-' between byte pairs.
    static EncryptionMaterial parse(const std::string& keyHex, const std::string& ivHex);

    // Canonical lowercase hex, as handed to the codec.
    [[nodiscard]] const std::string& keyHex() const { return keyHex_; }
    [[nodiscard]] const std::string& ivHex() const { return ivHex_; }

    [[nodiscard]] const std::vector<uint8_t>& key() const { return key_; }
    [[nodiscard]] const std::vector<uint8_t>& iv() const { return iv_; }

    bool operator==(const EncryptionMaterial& other) const = default;

private:
    EncryptionMaterial(std::vector<uint8_t> key, std::vector<uint8_t> iv);

    std::vector<uint8_t> key_, iv_;
    std::string keyHex_, ivHex_;
};

}
