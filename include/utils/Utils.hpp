/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// utils/Utils.hpp
#pragma once

#include <array>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <openssl/sha.h>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Common utility helpers used across NetSync.
 *
 * This header provides small, header-only helpers for:
 *  - identifier generation (uuid, MAC address),
 *  - SHA-1 digests used for compact controller tag values,
 *  - string splitting and numeric field parsing for configuration strings,
 *  - timestamp helpers.
 */
namespace utils
{

/// Longest display name the controller accepts; longer names are truncated.
constexpr std::size_t MAX_DISPLAY_NAME_LEN = 40;

/**
 * @brief Generate a random (version 4) uuid string.
 *
 * Thread-safe: the underlying generator is shared and guarded by a mutex.
 */
inline std::string
generateUuid()
{
    static std::mutex generatorMutex;
    static boost::uuids::random_generator generator;
    std::lock_guard<std::mutex> lock(generatorMutex);
    return boost::uuids::to_string(generator());
}

/**
 * @brief Convert a 48-bit MAC stored in uint64_t to string form.
 *
 * @param mac MAC value (lower 48 bits used).
 * @return MAC string ("aa:bb:cc:dd:ee:ff").
 */
inline std::string
macToString(uint64_t mac)
{
    std::ostringstream oss;

    for (int i = 5; i >= 0; --i)
    {
        uint8_t byte = (mac >> (i * 8)) & 0xFF;
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
        if (i > 0)
        {
            oss << ":";
        }
    }

    return oss.str();
}

/**
 * @brief Generate a random locally-administered MAC address under a fixed OUI prefix.
 *
 * @param prefix Upper 24 bits of the address (default fa:16:3e).
 */
inline std::string
generateMacAddress(uint32_t prefix = 0xfa163e)
{
    static std::mutex rngMutex;
    static std::mt19937_64 rng{std::random_device{}()};
    uint64_t suffix;
    {
        std::lock_guard<std::mutex> lock(rngMutex);
        suffix = rng() & 0xFFFFFF;
    }
    return macToString((static_cast<uint64_t>(prefix & 0xFFFFFF) << 24) | suffix);
}

/**
 * @brief Lower-case hex SHA-1 digest of @p input.
 *
 * Used to keep controller tag values short: device identifiers are tagged by digest.
 */
inline std::string
sha1Hex(const std::string& input)
{
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest.data());

    std::ostringstream oss;
    for (unsigned char byte : digest)
    {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

/// Split @p s on @p delimiter, keeping empty fields.
inline std::vector<std::string>
splitString(const std::string& s, char delimiter)
{
    std::vector<std::string> parts;
    std::string current;
    std::istringstream iss(s);
    while (std::getline(iss, current, delimiter))
    {
        parts.push_back(current);
    }
    if (!s.empty() && s.back() == delimiter)
    {
        parts.emplace_back();
    }
    return parts;
}

/**
 * @brief Parse a base-10 integer that must consume the whole string.
 *
 * Only an optional '-' may precede the digits; whitespace and '+' are rejected.
 *
 * @throws std::invalid_argument if @p s is empty, is not purely numeric or overflows.
 */
inline int
parseIntStrict(const std::string& s)
{
    if (s.empty())
    {
        throw std::invalid_argument("empty numeric field");
    }
    const std::size_t firstDigit = s[0] == '-' ? 1 : 0;
    if (firstDigit >= s.size() || !std::isdigit(static_cast<unsigned char>(s[firstDigit])))
    {
        throw std::invalid_argument("invalid numeric field: " + s);
    }
    std::size_t consumed = 0;
    int value = 0;
    try
    {
        value = std::stoi(s, &consumed, 10);
    }
    catch (const std::out_of_range&)
    {
        throw std::invalid_argument("numeric field out of range: " + s);
    }
    if (consumed != s.size())
    {
        throw std::invalid_argument("invalid numeric field: " + s);
    }
    return value;
}

/**
 * @brief Truncate a display name to what the controller stores.
 *
 * The cut never splits a UTF-8 sequence: a character that does not fit whole is dropped.
 */
inline std::string
truncateDisplayName(const std::string& name)
{
    if (name.size() <= MAX_DISPLAY_NAME_LEN)
    {
        return name;
    }
    std::size_t cut = MAX_DISPLAY_NAME_LEN;
    // Step back over continuation bytes (10xxxxxx) onto the lead byte of the split character
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80)
    {
        --cut;
    }
    return name.substr(0, cut);
}

/**
 * @brief Monotonic time in milliseconds (steady_clock).
 *
 * Suitable for measuring durations; not tied to wall-clock time.
 */
inline int64_t
getCurrentTimeMillisSteadyClock()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace utils
