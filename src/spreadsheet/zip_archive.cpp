#include "zip_archive.h"
#include "../common/error_handler.h"
#include <zlib.h>
#include <algorithm>

namespace exportflow {
namespace spreadsheet {

namespace {

constexpr uint32_t kEndOfCentralDirectory = 0x06054b50;
constexpr uint32_t kCentralFileHeader = 0x02014b50;
constexpr uint32_t kLocalFileHeader = 0x04034b50;
constexpr size_t kEndRecordSize = 22;
constexpr size_t kMaxCommentSize = 0xFFFF;

constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;

// Upper bound on the capacity reserved per compressed byte
constexpr size_t kMaxReserveRatio = 64;

uint16_t readU16(const std::string& bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<unsigned char>(bytes[offset]) |
                                 (static_cast<unsigned char>(bytes[offset + 1]) << 8));
}

uint32_t readU32(const std::string& bytes, size_t offset) {
    return static_cast<uint32_t>(readU16(bytes, offset)) |
           (static_cast<uint32_t>(readU16(bytes, offset + 2)) << 16);
}

[[noreturn]] void malformed(const std::string& details) {
    throw AutomationError(ErrorType::EXPORT_CONTENT, "Malformed workbook container", details);
}

} // anonymous namespace

ZipArchive::ZipArchive(std::string bytes) : m_bytes(std::move(bytes)) {
    readCentralDirectory();
}

void ZipArchive::readCentralDirectory() {
    if (m_bytes.size() < kEndRecordSize) {
        malformed("file too small for a ZIP container");
    }

    // The end record sits at the tail, possibly followed by an archive comment
    size_t lowest = m_bytes.size() > kEndRecordSize + kMaxCommentSize
                        ? m_bytes.size() - kEndRecordSize - kMaxCommentSize : 0;
    size_t endRecord = std::string::npos;
    for (size_t pos = m_bytes.size() - kEndRecordSize + 1; pos-- > lowest;) {
        if (readU32(m_bytes, pos) == kEndOfCentralDirectory) {
            endRecord = pos;
            break;
        }
    }
    if (endRecord == std::string::npos) {
        malformed("end of central directory not found");
    }

    uint16_t entryCount = readU16(m_bytes, endRecord + 10);
    uint32_t directoryOffset = readU32(m_bytes, endRecord + 16);
    if (directoryOffset == 0xFFFFFFFF || entryCount == 0xFFFF) {
        malformed("ZIP64 archives are not supported");
    }

    size_t pos = directoryOffset;
    for (uint16_t i = 0; i < entryCount; ++i) {
        if (pos + 46 > m_bytes.size() || readU32(m_bytes, pos) != kCentralFileHeader) {
            malformed("central directory entry " + std::to_string(i) + " is truncated");
        }

        uint16_t flags = readU16(m_bytes, pos + 8);
        Entry entry;
        entry.method = readU16(m_bytes, pos + 10);
        entry.compressedSize = readU32(m_bytes, pos + 20);
        entry.uncompressedSize = readU32(m_bytes, pos + 24);
        uint16_t nameLength = readU16(m_bytes, pos + 28);
        uint16_t extraLength = readU16(m_bytes, pos + 30);
        uint16_t commentLength = readU16(m_bytes, pos + 32);
        entry.localHeaderOffset = readU32(m_bytes, pos + 42);

        if (pos + 46 + nameLength > m_bytes.size()) {
            malformed("central directory name is truncated");
        }
        entry.name = m_bytes.substr(pos + 46, nameLength);

        if (flags & 0x1) {
            malformed("encrypted entry " + entry.name);
        }

        m_order.push_back(entry.name);
        m_entries[entry.name] = entry;
        pos += 46 + nameLength + extraLength + commentLength;
    }
}

std::vector<std::string> ZipArchive::entryNames() const {
    return m_order;
}

bool ZipArchive::contains(const std::string& name) const {
    return m_entries.count(name) > 0;
}

std::string ZipArchive::extract(const std::string& name) const {
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Workbook part missing", name);
    }
    const Entry& entry = it->second;

    size_t header = entry.localHeaderOffset;
    if (header + 30 > m_bytes.size() || readU32(m_bytes, header) != kLocalFileHeader) {
        malformed("local header of " + name + " is invalid");
    }
    size_t dataStart = header + 30 + readU16(m_bytes, header + 26) + readU16(m_bytes, header + 28);
    if (dataStart + entry.compressedSize > m_bytes.size()) {
        malformed("data of " + name + " is truncated");
    }

    const char* data = m_bytes.data() + dataStart;
    switch (entry.method) {
        case kMethodStored:
            return std::string(data, entry.compressedSize);
        case kMethodDeflated:
            return inflateRaw(data, entry.compressedSize, entry.uncompressedSize, name);
        default:
            malformed("unsupported compression method " + std::to_string(entry.method) + " for " + name);
    }
}

std::string ZipArchive::inflateRaw(const char* data, size_t size, uint32_t expected, const std::string& name) const {
    z_stream stream = {};
    // Negative window bits: raw deflate data without a zlib header
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Decompressor initialization failed", name);
    }

    // Header sizes are untrusted
    std::string output;
    output.reserve(std::min<size_t>(expected, size * kMaxReserveRatio));
    std::vector<char> buffer(64 * 1024);

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream.avail_in = static_cast<uInt>(size);

    int status = Z_OK;
    while (status != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());
        status = inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END) {
            std::string reason = stream.msg ? stream.msg : "zlib error " + std::to_string(status);
            inflateEnd(&stream);
            malformed("inflate failed for " + name + ": " + reason);
        }
        output.append(buffer.data(), buffer.size() - stream.avail_out);
        if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            malformed("deflate stream of " + name + " ends early");
        }
    }
    inflateEnd(&stream);
    return output;
}

} // namespace spreadsheet
} // namespace exportflow
