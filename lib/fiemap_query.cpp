#include "fiemap_query.hpp"

#include <spdlog/spdlog.h>

#include <linux/fs.h>  // FS_IOC_FIEMAP
#include <sys/ioctl.h> // ioctl

#include <cerrno>
#include <cstring>   // memset strerror
#include <stdexcept> // std::out_of_range

using sparsemap::Extent;
using sparsemap::FiemapException;
using sparsemap::FiemapQuery;
using sparsemap::QueryStatus;

FiemapQuery::FiemapQuery(uint64_t Start, uint64_t Length, uint32_t Flags)
    : m_start(Start)
    , m_length(Length)
    , m_flags(Flags)
    , m_record(std::make_unique<FiemapRecord>())
{
    ResetRecord();
}

void FiemapQuery::ResetRecord() noexcept
{
    // reserved words and unused slots must reach the kernel as zero
    memset(m_record.get(), 0, sizeof(FiemapRecord));

    m_record->fm_start        = m_start;
    m_record->fm_length       = m_length;
    m_record->fm_flags        = m_flags;
    m_record->fm_extent_count = FIEMAP_PAGE_CAPACITY;
}

QueryStatus FiemapQuery::Execute(const utils::LinuxFile& File)
{
    return Execute(File.GetDescriptor());
}

QueryStatus FiemapQuery::Execute(int Descriptor)
{
    ResetRecord();

    if (0 != ioctl(Descriptor, FS_IOC_FIEMAP, m_record.get()))
    {
        int err = errno;

        // the record may have been partially written, don't hand it out
        ResetRecord();

        if (EOPNOTSUPP == err || ENOTTY == err)
        {
            spdlog::warn("FS_IOC_FIEMAP ({}) is not supported by the filesystem: {}", Descriptor, strerror(err));
            return QueryStatus::UnsupportedFilesystem;
        }

        spdlog::error(
            "ioctl FS_IOC_FIEMAP ({}) start {} length {} flags {:#x} failed: {}",
            Descriptor,
            m_start,
            m_length,
            m_flags,
            strerror(err));
        throw FiemapException("FS_IOC_FIEMAP", err);
    }

    // the kernel never maps more than asked for, a larger count means the record was misread
    if (m_record->fm_mapped_extents > FIEMAP_PAGE_CAPACITY)
    {
        uint32_t mapped = m_record->fm_mapped_extents;
        ResetRecord();
        spdlog::error("FS_IOC_FIEMAP ({}) mapped {} extents into {} slots", Descriptor, mapped, FIEMAP_PAGE_CAPACITY);
        throw ValidationException("FS_IOC_FIEMAP mapped more extents than requested");
    }

    spdlog::debug(
        "FS_IOC_FIEMAP ({}) start {} length {}: {} extents", Descriptor, m_start, m_length, GetMappedCount());

    return QueryStatus::Mapped;
}

uint64_t FiemapQuery::GetStart() const noexcept
{
    return m_start;
}

uint64_t FiemapQuery::GetLength() const noexcept
{
    return m_length;
}

uint32_t FiemapQuery::GetFlags() const noexcept
{
    return m_flags;
}

uint32_t FiemapQuery::GetMappedCount() const noexcept
{
    return m_record->fm_mapped_extents;
}

Extent FiemapQuery::GetExtent(uint32_t Index) const
{
    if (Index >= GetMappedCount())
    {
        throw std::out_of_range("extent index " + std::to_string(Index) + " past mapped count " +
                                std::to_string(GetMappedCount()));
    }

    return Extent(m_record->fm_extents[Index]);
}

std::vector<Extent> FiemapQuery::GetExtents() const
{
    std::vector<Extent> result;
    result.reserve(GetMappedCount());

    for (uint32_t i = 0; i < GetMappedCount(); ++i)
    {
        result.emplace_back(m_record->fm_extents[i]);
    }

    return result;
}

bool FiemapQuery::IsPossiblyTruncated() const noexcept
{
    if (GetMappedCount() < FIEMAP_PAGE_CAPACITY)
    {
        return false;
    }

    return 0 == (m_record->fm_extents[FIEMAP_PAGE_CAPACITY - 1].fe_flags & FIEMAP_EXTENT_LAST);
}

uint64_t FiemapQuery::GetContinuationOffset() const noexcept
{
    if (0 == GetMappedCount())
    {
        return m_start;
    }

    return Extent(m_record->fm_extents[GetMappedCount() - 1]).GetLogicalEnd();
}

const sparsemap::FiemapRecord& FiemapQuery::GetRecord() const noexcept
{
    return *m_record;
}

FiemapException::FiemapException(const char* const Message, const int Errno)
    : ErrnoException(Message, Errno)
{}
