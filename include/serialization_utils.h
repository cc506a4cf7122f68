// include/serialization_utils.h
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace strata {

// Little-endian fixed-width codec shared by the WAL and SSTable formats.
void PutFixed32(std::string& dst, uint32_t value);
void PutFixed64(std::string& dst, uint64_t value);
uint32_t DecodeFixed32(const char* ptr);
uint64_t DecodeFixed64(const char* ptr);

// Appends [len:u32][bytes].
void PutLengthPrefixed(std::string& dst, std::string_view value);

/**
 * @brief Reads a u32 length-prefixed slice from input, advancing it.
 * @return false if input is too short to hold the prefix or the bytes.
 */
bool GetLengthPrefixed(std::string_view& input, std::string_view& result);
bool GetFixed32(std::string_view& input, uint32_t& value);
bool GetFixed64(std::string_view& input, uint64_t& value);

/**
 * @brief Serializes a string to an output stream with a 32-bit length prefix.
 * @throws std::overflow_error if the string is too long.
 * @throws std::runtime_error on stream write failure.
 */
void SerializeString(std::ostream& out, const std::string& str);

/**
 * @brief Deserializes a length-prefixed string from an input stream.
 * @throws std::runtime_error on stream read failure or data corruption.
 * @throws std::length_error if the serialized length is unreasonably large.
 */
std::string DeserializeString(std::istream& in);

} // namespace strata
