#include "sparse_map.hpp"

#include "extent_mapper.hpp"        // sparsemap::MapExtents
#include "position_prober.hpp"      // sparsemap::SeekToData sparsemap::SeekToHole
#include "sparsemap_exceptions.hpp" // sparsemap::ValidationException

#include <spdlog/spdlog.h>

#include <unistd.h> // lseek

#include <algorithm> // std::min
#include <cerrno>
#include <cstring> // strerror

using sparsemap::Extent;
using sparsemap::MapMethod;
using sparsemap::Region;
using sparsemap::RegionKind;
using sparsemap::SeekException;
using sparsemap::SeekOffset;
using sparsemap::SparseMap;
using sparsemap::utils::LinuxFile;

namespace {
    // puts the cursor back on scope exit, SEEK_DATA / SEEK_HOLE move it around
    class CursorGuard
    {
    public:
        explicit CursorGuard(const LinuxFile& File)
            : m_file(File)
            , m_cursor(sparsemap::GetCursor(File))
        {}

        CursorGuard(const CursorGuard&) = delete;
        CursorGuard& operator=(const CursorGuard&) = delete;

        ~CursorGuard() noexcept
        {
            if (-1 == lseek(m_file.GetDescriptor(), static_cast<off_t>(m_cursor), SEEK_SET))
            {
                int err = errno;
                spdlog::error(
                    "failed to restore cursor {} of \"{}\"({}): {}",
                    m_cursor,
                    m_file.GetFilePath(),
                    m_file.GetDescriptor(),
                    strerror(err));
            }
        }

    private:
        const LinuxFile& m_file;
        const uint64_t   m_cursor;
    };
} // namespace

bool Region::operator==(const Region& Other) const noexcept
{
    return Offset == Other.Offset && Length == Other.Length && Kind == Other.Kind;
}

bool Region::operator!=(const Region& Other) const noexcept
{
    return !(*this == Other);
}

SparseMap::SparseMap(MapMethod Method, uint64_t FileSize) noexcept
    : m_method(Method)
    , m_fileSize(FileSize)
    , m_regions()
{}

SparseMap SparseMap::Build(const LinuxFile& File)
{
    const auto fileSize = static_cast<uint64_t>(File.GetFileSize());

    if (0 == fileSize)
    {
        return SparseMap(MapMethod::Fiemap, 0);
    }

    std::vector<Extent> extents;
    if (QueryStatus::Mapped == MapExtents(File, &extents, 0, fileSize))
    {
        return FromExtents(fileSize, extents);
    }

    spdlog::info("\"{}\": no extent map, scanning with SEEK_DATA/SEEK_HOLE", File.GetFilePath());
    return ScanWithSeek(File, fileSize);
}

SparseMap SparseMap::FromExtents(uint64_t FileSize, const std::vector<Extent>& Extents)
{
    SparseMap map(MapMethod::Fiemap, FileSize);

    for (const auto& extent : Extents)
    {
        // preallocated space past the end of the file isn't part of it
        if (extent.GetLogicalOffset() >= FileSize)
        {
            continue;
        }

        map.AddData(extent.GetLogicalOffset(), std::min(extent.GetLogicalEnd(), FileSize));
    }

    map.Finish();
    return map;
}

SparseMap SparseMap::Opaque(uint64_t FileSize)
{
    SparseMap map(MapMethod::Opaque, FileSize);
    map.AddData(0, FileSize);
    map.Finish();
    return map;
}

SparseMap SparseMap::ScanWithSeek(const LinuxFile& File, uint64_t FileSize)
{
    SparseMap   map(MapMethod::SeekScan, FileSize);
    CursorGuard guard(File);

    uint64_t position = 0;
    while (position < FileSize)
    {
        SeekOffset data = SeekOffset::EndOfRegion();
        try
        {
            data = SeekToData(File, position);
        }
        catch (const SeekException& exc)
        {
            if (EINVAL != exc.GetErrno())
            {
                throw;
            }

            spdlog::warn("\"{}\": SEEK_DATA is not supported, treating the file as opaque", File.GetFilePath());
            return Opaque(FileSize);
        }

        // only a hole remains
        if (data.IsEndOfRegion())
        {
            break;
        }

        SeekOffset hole = SeekToHole(File, data.GetOffset());

        // clip to the size the scan started with
        uint64_t end = hole.IsEndOfRegion() ? FileSize : std::min(hole.GetOffset(), FileSize);
        if (end <= data.GetOffset())
        {
            break;
        }

        map.AddData(data.GetOffset(), end);
        position = end;
    }

    map.Finish();
    return map;
}

void SparseMap::AddData(uint64_t Begin, uint64_t End)
{
    if (End <= Begin)
    {
        return;
    }

    uint64_t previousEnd = m_regions.empty() ? 0 : m_regions.back().GetEnd();

    if (Begin < previousEnd)
    {
        throw ValidationException("data regions must be added in ascending order");
    }

    if (Begin > previousEnd)
    {
        m_regions.push_back({previousEnd, Begin - previousEnd, RegionKind::Hole});
    }
    else if (!m_regions.empty() && RegionKind::Data == m_regions.back().Kind)
    {
        // touching extents form one data region
        m_regions.back().Length += End - Begin;
        return;
    }

    m_regions.push_back({Begin, End - Begin, RegionKind::Data});
}

void SparseMap::Finish()
{
    uint64_t previousEnd = m_regions.empty() ? 0 : m_regions.back().GetEnd();

    if (previousEnd < m_fileSize)
    {
        m_regions.push_back({previousEnd, m_fileSize - previousEnd, RegionKind::Hole});
    }
}

MapMethod SparseMap::GetMethod() const noexcept
{
    return m_method;
}

uint64_t SparseMap::GetFileSize() const noexcept
{
    return m_fileSize;
}

const std::vector<Region>& SparseMap::GetRegions() const noexcept
{
    return m_regions;
}

std::vector<Region> SparseMap::Select(RegionKind Kind) const
{
    std::vector<Region> result;
    for (const auto& region : m_regions)
    {
        if (Kind == region.Kind)
        {
            result.push_back(region);
        }
    }
    return result;
}

std::vector<Region> SparseMap::GetDataRegions() const
{
    return Select(RegionKind::Data);
}

std::vector<Region> SparseMap::GetHoles() const
{
    return Select(RegionKind::Hole);
}

uint64_t SparseMap::GetAllocatedBytes() const noexcept
{
    uint64_t result = 0;
    for (const auto& region : m_regions)
    {
        if (RegionKind::Data == region.Kind)
        {
            result += region.Length;
        }
    }
    return result;
}
