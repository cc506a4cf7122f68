// src/serialization_utils.cpp
#include "serialization_utils.h"

#include <limits>
#include <stdexcept>

namespace strata {

void PutFixed32(std::string& dst, uint32_t value) {
    char buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<char>((value >> (8 * i)) & 0xff);
    }
    dst.append(buf, sizeof(buf));
}

void PutFixed64(std::string& dst, uint64_t value) {
    char buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<char>((value >> (8 * i)) & 0xff);
    }
    dst.append(buf, sizeof(buf));
}

uint32_t DecodeFixed32(const char* ptr) {
    const auto* p = reinterpret_cast<const unsigned char*>(ptr);
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | p[i];
    }
    return value;
}

uint64_t DecodeFixed64(const char* ptr) {
    const auto* p = reinterpret_cast<const unsigned char*>(ptr);
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | p[i];
    }
    return value;
}

void PutLengthPrefixed(std::string& dst, std::string_view value) {
    if (value.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::overflow_error("PutLengthPrefixed: length exceeds uint32_t max.");
    }
    PutFixed32(dst, static_cast<uint32_t>(value.size()));
    dst.append(value.data(), value.size());
}

bool GetFixed32(std::string_view& input, uint32_t& value) {
    if (input.size() < 4) return false;
    value = DecodeFixed32(input.data());
    input.remove_prefix(4);
    return true;
}

bool GetFixed64(std::string_view& input, uint64_t& value) {
    if (input.size() < 8) return false;
    value = DecodeFixed64(input.data());
    input.remove_prefix(8);
    return true;
}

bool GetLengthPrefixed(std::string_view& input, std::string_view& result) {
    uint32_t len = 0;
    std::string_view rest = input;
    if (!GetFixed32(rest, len) || rest.size() < len) {
        return false;
    }
    result = rest.substr(0, len);
    rest.remove_prefix(len);
    input = rest;
    return true;
}

void SerializeString(std::ostream& out, const std::string& str) {
    if (str.length() > std::numeric_limits<uint32_t>::max()) {
        throw std::overflow_error("SerializeString: String length exceeds uint32_t max.");
    }
    std::string prefix;
    PutFixed32(prefix, static_cast<uint32_t>(str.length()));
    out.write(prefix.data(), prefix.size());
    if (!out) {
        throw std::runtime_error("SerializeString: Failed to write string length.");
    }
    if (!str.empty()) {
        out.write(str.data(), static_cast<std::streamsize>(str.size()));
        if (!out) {
            throw std::runtime_error("SerializeString: Failed to write string data.");
        }
    }
}

std::string DeserializeString(std::istream& in) {
    char prefix[4];
    in.read(prefix, sizeof(prefix));
    if (in.gcount() != sizeof(prefix)) {
        throw std::runtime_error("DeserializeString: Failed to read string length.");
    }
    uint32_t len = DecodeFixed32(prefix);

    // Guards against huge allocations from corrupt data.
    constexpr uint32_t MAX_SANE_STRING_LEN = 100 * 1024 * 1024;
    if (len > MAX_SANE_STRING_LEN) {
        throw std::length_error("DeserializeString: String length in stream (" + std::to_string(len) + ") exceeds sanity limit.");
    }
    if (len == 0) return "";

    std::string str(len, '\0');
    in.read(&str[0], len);
    if (static_cast<uint32_t>(in.gcount()) != len) {
        throw std::runtime_error("DeserializeString: Failed to read full string data. Expected " + std::to_string(len) + " bytes.");
    }
    return str;
}

} // namespace strata
