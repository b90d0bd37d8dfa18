#ifndef _SPARSE_MAP_HPP_
#define _SPARSE_MAP_HPP_

#include "extent.hpp"     // sparsemap::Extent
#include "linux_file.hpp" // sparsemap::utils::LinuxFile

#include <cstdint> // uint64_t
#include <vector>  // std::vector

namespace sparsemap {
    enum class RegionKind
    {
        Data,
        Hole,
    };

    // how a SparseMap found its regions
    enum class MapMethod
    {
        Fiemap,   // FS_IOC_FIEMAP extents
        SeekScan, // lseek SEEK_DATA / SEEK_HOLE walk
        Opaque,   // no sparse information, the whole file is data
    };

    struct Region;
    class SparseMap;
} // namespace sparsemap

struct sparsemap::Region
{
    uint64_t   Offset;
    uint64_t   Length;
    RegionKind Kind;

    [[nodiscard]] inline uint64_t GetEnd() const noexcept
    {
        return Offset + Length;
    }

    bool operator==(const Region& Other) const noexcept;
    bool operator!=(const Region& Other) const noexcept;
};

/*
 * Data and hole regions tiling [0, file size) of one file, in ascending order, with neighbours
 * always of different kinds.
 *
 * Build() asks FS_IOC_FIEMAP first. Every extent counts as data, unwritten (preallocated) ones
 * included, since they are physically allocated; extents past the end of the file are dropped.
 * On a filesystem without fiemap support the file is walked with SEEK_DATA / SEEK_HOLE instead,
 * and the cursor is put back where it was afterwards. If the kernel rejects SEEK_DATA too the file
 * is reported as a single data region.
 */
class sparsemap::SparseMap
{
public:
    [[nodiscard]] static SparseMap Build(const utils::LinuxFile& File);

    // regions of a file of FileSize bytes whose allocated parts are Extents (ascending)
    [[nodiscard]] static SparseMap FromExtents(uint64_t FileSize, const std::vector<Extent>& Extents);

    // a single data region over the whole file, for files without any sparse information
    [[nodiscard]] static SparseMap Opaque(uint64_t FileSize);

    [[nodiscard]] MapMethod GetMethod() const noexcept;
    [[nodiscard]] uint64_t  GetFileSize() const noexcept;

    [[nodiscard]] const std::vector<Region>& GetRegions() const noexcept;
    [[nodiscard]] std::vector<Region>        GetDataRegions() const;
    [[nodiscard]] std::vector<Region>        GetHoles() const;

    // total length of the data regions
    [[nodiscard]] uint64_t GetAllocatedBytes() const noexcept;

private:
    SparseMap(MapMethod Method, uint64_t FileSize) noexcept;

    static SparseMap ScanWithSeek(const utils::LinuxFile& File, uint64_t FileSize);

    // appends [Begin, End) as data, filling the gap before it with a hole
    void AddData(uint64_t Begin, uint64_t End);

    // closes the map with a trailing hole up to the file size
    void Finish();

    [[nodiscard]] std::vector<Region> Select(RegionKind Kind) const;

    MapMethod           m_method;
    uint64_t            m_fileSize;
    std::vector<Region> m_regions;
};

#endif // !_SPARSE_MAP_HPP_
