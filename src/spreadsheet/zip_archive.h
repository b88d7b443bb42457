#ifndef EXPORTFLOW_ZIP_ARCHIVE_H
#define EXPORTFLOW_ZIP_ARCHIVE_H

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace exportflow {
namespace spreadsheet {

/**
 * @brief Read-only view of a ZIP container held in memory
 *
 * Supports stored and deflated entries, which is all a workbook writer
 * produces. ZIP64 and encrypted archives are rejected.
 */
class ZipArchive {
public:
    struct Entry {
        std::string name;
        uint16_t method;
        uint32_t compressedSize;
        uint32_t uncompressedSize;
        uint32_t localHeaderOffset;
    };

    // Parses the central directory; throws AutomationError(EXPORT_CONTENT)
    explicit ZipArchive(std::string bytes);

    std::vector<std::string> entryNames() const;
    bool contains(const std::string& name) const;

    // Decompressed content of one entry
    std::string extract(const std::string& name) const;

private:
    void readCentralDirectory();
    std::string inflateRaw(const char* data, size_t size, uint32_t expected, const std::string& name) const;

    std::string m_bytes;
    std::map<std::string, Entry> m_entries;
    std::vector<std::string> m_order;
};

} // namespace spreadsheet
} // namespace exportflow

#endif // EXPORTFLOW_ZIP_ARCHIVE_H
