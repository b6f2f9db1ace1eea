#include "codec/EncryptionMaterial.hpp"

#include <sodium.h>

using namespace aax::codec;

namespace {

std::vector<uint8_t> decodeHex(std::string hex, const char* field) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) hex.erase(0, 2);
    if (hex.empty()) throw ParseError(std::string(field) + " is missing");

    std::vector<uint8_t> bin(hex.size() / 2 + 1);
    size_t binLen = 0;
    const char* hexEnd = nullptr;

    if (sodium_hex2bin(bin.data(), bin.size(), hex.data(), hex.size(), " :-", &binLen, &hexEnd) != 0
        || hexEnd != hex.data() + hex.size())
        throw ParseError(std::string(field) + " is not valid hex");

    if (binLen == 0) throw ParseError(std::string(field) + " is missing");

    bin.resize(binLen);
    return bin;
}

std::string encodeHex(const std::vector<uint8_t>& bin) {
    std::string out(bin.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), bin.data(), bin.size());
    out.pop_back();
    return out;
}

}

EncryptionMaterial::EncryptionMaterial(std::vector<uint8_t> key, std::vector<uint8_t> iv)
    : key_(std::move(key)), iv_(std::move(iv)), keyHex_(encodeHex(key_)), ivHex_(encodeHex(iv_)) {}

EncryptionMaterial EncryptionMaterial::parse(const std::string& keyHex, const std::string& ivHex) {
    auto key = decodeHex(keyHex, "key");
    auto iv = decodeHex(ivHex, "iv");
    return {std::move(key), std::move(iv)};
}
