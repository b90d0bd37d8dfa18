#ifndef _FIEMAP_RECORD_HPP_
#define _FIEMAP_RECORD_HPP_

#include <linux/fiemap.h> // struct fiemap struct fiemap_extent

#include <cstddef> // offsetof
#include <cstdint> // uint32_t uint64_t

/*
 * FS_IOC_FIEMAP exchanges a single in/out record: a 32 byte header followed by an array of
 * fm_extent_count extent entries (56 bytes each). The kernel header declares the array as a
 * flexible member, so a record with room for a whole page of extents is spelled out here
 * field by field. Every offset is checked against <linux/fiemap.h> below; a layout mismatch
 * would silently corrupt the results instead of failing.
 *
 * All reserved words must be zero when the record is handed to the kernel.
 */

namespace sparsemap {
    // number of extent slots in one request (one "page" of the extent map)
    constexpr uint32_t FIEMAP_PAGE_CAPACITY = 256;

    // requested length meaning "up to the end of the file"
    constexpr uint64_t FIEMAP_WHOLE_FILE = FIEMAP_MAX_OFFSET;

    struct FiemapExtentRecord;
    struct FiemapRecord;
} // namespace sparsemap

struct sparsemap::FiemapExtentRecord
{
    uint64_t fe_logical;  /* logical offset in bytes of the extent start */
    uint64_t fe_physical; /* physical offset in bytes of the extent start */
    uint64_t fe_length;   /* length in bytes */
    uint64_t fe_reserved64[2];
    uint32_t fe_flags; /* FIEMAP_EXTENT_* */
    uint32_t fe_reserved[3];
};

struct sparsemap::FiemapRecord
{
    uint64_t fm_start;          /* logical offset (inclusive) at which to start mapping (in) */
    uint64_t fm_length;         /* logical length of the mapping (in) */
    uint32_t fm_flags;          /* FIEMAP_FLAG_* (in/out) */
    uint32_t fm_mapped_extents; /* number of extents that were mapped (out) */
    uint32_t fm_extent_count;   /* size of fm_extents (in) */
    uint32_t fm_reserved;
    FiemapExtentRecord fm_extents[FIEMAP_PAGE_CAPACITY]; /* mapped extents (out) */
};

static_assert(sizeof(sparsemap::FiemapExtentRecord) == sizeof(struct fiemap_extent), "fiemap_extent size");
static_assert(offsetof(sparsemap::FiemapExtentRecord, fe_logical) == offsetof(struct fiemap_extent, fe_logical));
static_assert(offsetof(sparsemap::FiemapExtentRecord, fe_physical) == offsetof(struct fiemap_extent, fe_physical));
static_assert(offsetof(sparsemap::FiemapExtentRecord, fe_length) == offsetof(struct fiemap_extent, fe_length));
static_assert(
    offsetof(sparsemap::FiemapExtentRecord, fe_reserved64) == offsetof(struct fiemap_extent, fe_reserved64));
static_assert(offsetof(sparsemap::FiemapExtentRecord, fe_flags) == offsetof(struct fiemap_extent, fe_flags));
static_assert(offsetof(sparsemap::FiemapExtentRecord, fe_reserved) == offsetof(struct fiemap_extent, fe_reserved));

static_assert(offsetof(sparsemap::FiemapRecord, fm_start) == offsetof(struct fiemap, fm_start));
static_assert(offsetof(sparsemap::FiemapRecord, fm_length) == offsetof(struct fiemap, fm_length));
static_assert(offsetof(sparsemap::FiemapRecord, fm_flags) == offsetof(struct fiemap, fm_flags));
static_assert(offsetof(sparsemap::FiemapRecord, fm_mapped_extents) == offsetof(struct fiemap, fm_mapped_extents));
static_assert(offsetof(sparsemap::FiemapRecord, fm_extent_count) == offsetof(struct fiemap, fm_extent_count));
static_assert(offsetof(sparsemap::FiemapRecord, fm_reserved) == offsetof(struct fiemap, fm_reserved));
static_assert(offsetof(sparsemap::FiemapRecord, fm_extents) == sizeof(struct fiemap), "fiemap header size");
static_assert(
    sizeof(sparsemap::FiemapRecord) ==
        sizeof(struct fiemap) + sparsemap::FIEMAP_PAGE_CAPACITY * sizeof(struct fiemap_extent),
    "fiemap record padding");

#endif // !_FIEMAP_RECORD_HPP_
