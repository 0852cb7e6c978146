/**
 * ROM Audit - Checksum Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Checksum.hpp"

#include <QCryptographicHash>
#include <QIODevice>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <tuple>

#include <zlib.h>

namespace romaudit {

namespace {
    constexpr qint64 CHUNK_SIZE = 64 * 1024;
    
    bool isHexString(const std::string& value) {
        return std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isxdigit(c) != 0;
        });
    }
}

bool Checksum::matches(const Checksum& other) const {
    bool compared = false;
    
    if (hasCrc() && other.hasCrc()) {
        if (*crc != *other.crc) {
            return false;
        }
        compared = true;
    }
    if (hasSha1() && other.hasSha1()) {
        if (sha1 != other.sha1) {
            return false;
        }
        compared = true;
    }
    
    return compared;
}

std::string Checksum::crcHex() const {
    if (!crc) {
        return {};
    }
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", *crc);
    return buffer;
}

std::string Checksum::toString() const {
    std::string result;
    if (hasCrc()) {
        result = "crc:" + crcHex();
    }
    if (hasSha1()) {
        if (!result.empty()) {
            result += ' ';
        }
        result += "sha1:" + sha1;
    }
    return result.empty() ? "<none>" : result;
}

bool Checksum::operator<(const Checksum& other) const {
    // Missing CRCs sort first
    return std::tie(sha1, crc) < std::tie(other.sha1, other.crc);
}

std::optional<uint32_t> Checksum::parseCrc(const std::string& hex) {
    if (hex.empty() || hex.size() > 8 || !isHexString(hex)) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
}

std::optional<std::string> Checksum::normalizeSha1(const std::string& hex) {
    if (hex.size() != 40 || !isHexString(hex)) {
        return std::nullopt;
    }
    std::string lower = hex;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

Checksum Checksum::fromHex(const std::string& crcHex, const std::string& sha1Hex) {
    Checksum checksum;
    checksum.crc = parseCrc(crcHex);
    checksum.sha1 = normalizeSha1(sha1Hex).value_or(std::string());
    return checksum;
}

std::optional<Checksum> computeChecksum(QIODevice& device) {
    if (!device.isOpen() || !device.isReadable()) {
        return std::nullopt;
    }
    
    QCryptographicHash sha1(QCryptographicHash::Sha1);
    uLong crc = ::crc32(0L, Z_NULL, 0);
    
    QByteArray chunk;
    while (!device.atEnd()) {
        chunk = device.read(CHUNK_SIZE);
        if (chunk.isEmpty()) {
            // atEnd() false with nothing read means the device failed
            if (!device.atEnd()) {
                return std::nullopt;
            }
            break;
        }
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(chunk.constData()),
                      static_cast<uInt>(chunk.size()));
        sha1.addData(chunk);
    }
    
    Checksum result;
    result.crc = static_cast<uint32_t>(crc);
    result.sha1 = sha1.result().toHex().toStdString();
    return result;
}

Checksum computeChecksum(const QByteArray& data) {
    Checksum result;
    result.crc = static_cast<uint32_t>(::crc32(
        ::crc32(0L, Z_NULL, 0),
        reinterpret_cast<const Bytef*>(data.constData()),
        static_cast<uInt>(data.size())));
    result.sha1 = QCryptographicHash::hash(data, QCryptographicHash::Sha1).toHex().toStdString();
    return result;
}

} // namespace romaudit
