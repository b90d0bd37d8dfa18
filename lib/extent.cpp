#include "extent.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>

using sparsemap::Extent;

Extent::Extent(uint64_t LogicalOffset, uint64_t PhysicalOffset, uint64_t Length, uint32_t Flags) noexcept
    : m_logicalOffset(LogicalOffset)
    , m_physicalOffset(PhysicalOffset)
    , m_length(Length)
    , m_flags(Flags)
{}

Extent::Extent(const FiemapExtentRecord& Record) noexcept
    : Extent(Record.fe_logical, Record.fe_physical, Record.fe_length, Record.fe_flags)
{}

uint64_t Extent::GetLogicalEnd() const noexcept
{
    if (m_length > UINT64_MAX - m_logicalOffset)
    {
        return UINT64_MAX;
    }
    return m_logicalOffset + m_length;
}

bool Extent::HasFlags(uint32_t Flags) const noexcept
{
    return Flags == (m_flags & Flags);
}

bool Extent::IsLast() const noexcept
{
    return HasFlags(FIEMAP_EXTENT_LAST);
}

bool Extent::IsUnknown() const noexcept
{
    return HasFlags(FIEMAP_EXTENT_UNKNOWN);
}

bool Extent::IsDelalloc() const noexcept
{
    return HasFlags(FIEMAP_EXTENT_DELALLOC);
}

bool Extent::IsUnwritten() const noexcept
{
    return HasFlags(FIEMAP_EXTENT_UNWRITTEN);
}

bool Extent::IsShared() const noexcept
{
    return HasFlags(FIEMAP_EXTENT_SHARED);
}

bool Extent::IsNotAligned() const noexcept
{
    return HasFlags(FIEMAP_EXTENT_NOT_ALIGNED);
}

bool Extent::Overlaps(uint64_t Offset, uint64_t Length) const noexcept
{
    if (0 == Length || 0 == m_length)
    {
        return false;
    }

    uint64_t end = (Length > UINT64_MAX - Offset) ? UINT64_MAX : Offset + Length;

    return m_logicalOffset < end && Offset < GetLogicalEnd();
}

bool Extent::operator==(const Extent& Other) const noexcept
{
    return m_logicalOffset == Other.m_logicalOffset && m_physicalOffset == Other.m_physicalOffset &&
           m_length == Other.m_length && m_flags == Other.m_flags;
}

bool Extent::operator!=(const Extent& Other) const noexcept
{
    return !(*this == Other);
}

std::string sparsemap::ExtentFlagsToString(uint32_t Flags)
{
    static const struct
    {
        uint32_t    Flag;
        const char* Name;
    } names[] = {
        {FIEMAP_EXTENT_LAST, "LAST"},
        {FIEMAP_EXTENT_UNKNOWN, "UNKNOWN"},
        {FIEMAP_EXTENT_DELALLOC, "DELALLOC"},
        {FIEMAP_EXTENT_ENCODED, "ENCODED"},
        {FIEMAP_EXTENT_DATA_ENCRYPTED, "DATA_ENCRYPTED"},
        {FIEMAP_EXTENT_NOT_ALIGNED, "NOT_ALIGNED"},
        {FIEMAP_EXTENT_DATA_INLINE, "DATA_INLINE"},
        {FIEMAP_EXTENT_DATA_TAIL, "DATA_TAIL"},
        {FIEMAP_EXTENT_UNWRITTEN, "UNWRITTEN"},
        {FIEMAP_EXTENT_MERGED, "MERGED"},
        {FIEMAP_EXTENT_SHARED, "SHARED"},
    };

    if (0 == Flags)
    {
        return "NONE";
    }

    std::string result;
    for (const auto& name : names)
    {
        if (Flags & name.Flag)
        {
            if (!result.empty())
            {
                result += '|';
            }
            result += name.Name;
            Flags &= ~name.Flag;
        }
    }

    // bits this header does not know about
    if (0 != Flags)
    {
        if (!result.empty())
        {
            result += '|';
        }
        result += fmt::format("{:#x}", Flags);
    }

    return result;
}
