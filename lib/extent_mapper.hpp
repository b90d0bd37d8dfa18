#ifndef _EXTENT_MAPPER_HPP_
#define _EXTENT_MAPPER_HPP_

#include "extent.hpp"         // sparsemap::Extent
#include "fiemap_query.hpp"   // sparsemap::QueryStatus
#include "fiemap_record.hpp"  // sparsemap::FIEMAP_WHOLE_FILE
#include "linux_file.hpp"     // sparsemap::utils::LinuxFile

#include <cstdint> // uint32_t uint64_t
#include <vector>  // std::vector

namespace sparsemap {
    /*
     * Maps every extent overlapping [Start, Start + Length) by re-issuing FS_IOC_FIEMAP one page at
     * a time. Each follow-up page starts at the logical end of the last extent received, so an extent
     * is never reported twice. Stops on a short page, on FIEMAP_EXTENT_LAST, or once the range is covered.
     *
     * Extents is cleared first and holds the result in ascending logical order on QueryStatus::Mapped.
     * Throws FiemapException on I/O failures and ValidationException if the pages overlap or stall.
     */
    [[nodiscard]] QueryStatus MapExtents(
        const utils::LinuxFile& File,
        std::vector<Extent>*    Extents,
        uint64_t                Start  = 0,
        uint64_t                Length = FIEMAP_WHOLE_FILE,
        uint32_t                Flags  = 0);
} // namespace sparsemap

#endif // !_EXTENT_MAPPER_HPP_
