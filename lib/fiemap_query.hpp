#ifndef _FIEMAP_QUERY_HPP_
#define _FIEMAP_QUERY_HPP_

#include "extent.hpp"               // sparsemap::Extent
#include "fiemap_record.hpp"        // sparsemap::FiemapRecord
#include "linux_file.hpp"           // sparsemap::utils::LinuxFile
#include "sparsemap_exceptions.hpp" // sparsemap::ErrnoException

#include <cstdint> // uint32_t uint64_t
#include <memory>  // std::unique_ptr
#include <vector>  // std::vector

namespace sparsemap {
    enum class QueryStatus
    {
        Mapped,                // the record holds the extents of the requested range
        UnsupportedFilesystem, // the filesystem cannot report extents, probe with lseek instead
    };

    class FiemapQuery;
    class FiemapException;
} // namespace sparsemap

/*
 * A single FS_IOC_FIEMAP request over [Start, Start + Length).
 *
 * The kernel fills at most FIEMAP_PAGE_CAPACITY extents per call. When GetMappedCount() reaches
 * the capacity the answer may be cut short: IsPossiblyTruncated() tells whether a follow-up query
 * starting at GetContinuationOffset() is needed (see MapExtents() for the whole loop).
 *
 * Execute() neither moves the file cursor nor touches the file content. It may be called again,
 * the record is rebuilt from scratch every time.
 */
class sparsemap::FiemapQuery
{
public:
    explicit FiemapQuery(uint64_t Start = 0, uint64_t Length = FIEMAP_WHOLE_FILE, uint32_t Flags = 0);

    FiemapQuery(const FiemapQuery&) = delete;
    FiemapQuery& operator=(const FiemapQuery&) = delete;

    FiemapQuery(FiemapQuery&&) = delete;
    FiemapQuery& operator=(FiemapQuery&&) = delete;

    ~FiemapQuery() = default;

    // throws FiemapException for anything but success or an unsupported filesystem
    [[nodiscard]] QueryStatus Execute(const utils::LinuxFile& File);
    [[nodiscard]] QueryStatus Execute(int Descriptor);

    [[nodiscard]] uint64_t GetStart() const noexcept;
    [[nodiscard]] uint64_t GetLength() const noexcept;
    [[nodiscard]] uint32_t GetFlags() const noexcept;

    [[nodiscard]] static constexpr uint32_t GetCapacity() noexcept
    {
        return FIEMAP_PAGE_CAPACITY;
    }

    [[nodiscard]] uint32_t GetMappedCount() const noexcept;

    // throws std::out_of_range past GetMappedCount()
    [[nodiscard]] Extent GetExtent(uint32_t Index) const;

    [[nodiscard]] std::vector<Extent> GetExtents() const;

    // the page is full and its last extent is not flagged as the last one of the file
    [[nodiscard]] bool IsPossiblyTruncated() const noexcept;

    // logical end of the last mapped extent, or the requested start if nothing was mapped
    [[nodiscard]] uint64_t GetContinuationOffset() const noexcept;

    [[nodiscard]] const FiemapRecord& GetRecord() const noexcept;

private:
    void ResetRecord() noexcept;

    uint64_t                      m_start;
    uint64_t                      m_length;
    uint32_t                      m_flags;
    std::unique_ptr<FiemapRecord> m_record;
};

class sparsemap::FiemapException : public ErrnoException
{
public:
    explicit FiemapException(const char* Message, int Errno);
};

#endif // !_FIEMAP_QUERY_HPP_
