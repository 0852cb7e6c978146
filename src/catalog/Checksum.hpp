/**
 * ROM Audit - Checksum
 * 
 * Content identity for catalog parts and supplied files.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <QByteArray>

class QIODevice;

namespace romaudit {

/**
 * CRC32 + SHA1 pair identifying a piece of content
 * 
 * Catalog entries may carry only one of the two values (disks only
 * declare a SHA1, older DATs only a CRC). Hashed files always carry both.
 */
struct Checksum {
    std::optional<uint32_t> crc;
    std::string sha1;              // lowercase hex, empty if unknown
    
    bool hasCrc() const { return crc.has_value(); }
    bool hasSha1() const { return !sha1.empty(); }
    bool isEmpty() const { return !hasCrc() && !hasSha1(); }
    
    /**
     * Content comparison
     * 
     * Every value known on both sides must be equal and at least one
     * value must be comparable.
     */
    bool matches(const Checksum& other) const;
    
    std::string crcHex() const;
    std::string toString() const;
    
    bool operator==(const Checksum& other) const {
        return crc == other.crc && sha1 == other.sha1;
    }
    bool operator!=(const Checksum& other) const { return !(*this == other); }
    bool operator<(const Checksum& other) const;
    
    /**
     * Parse an 8 digit hex CRC ("1d460eee", case-insensitive)
     */
    static std::optional<uint32_t> parseCrc(const std::string& hex);
    
    /**
     * Validate and lowercase a 40 digit hex SHA1
     */
    static std::optional<std::string> normalizeSha1(const std::string& hex);
    
    static Checksum fromHex(const std::string& crcHex, const std::string& sha1Hex);
};

/**
 * Injected hashing function: stream -> checksum, nullopt on read failure
 */
using ChecksumFunction = std::function<std::optional<Checksum>(QIODevice&)>;

/**
 * Hash a stream with zlib's CRC32 and SHA1, in 64 KiB chunks
 */
std::optional<Checksum> computeChecksum(QIODevice& device);

/**
 * Hash an in-memory buffer
 */
Checksum computeChecksum(const QByteArray& data);

} // namespace romaudit
