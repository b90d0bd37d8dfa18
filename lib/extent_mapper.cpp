#include "extent_mapper.hpp"

#include "sparsemap_exceptions.hpp" // sparsemap::ValidationException

#include <spdlog/spdlog.h>

#include <cstdint>

using sparsemap::Extent;
using sparsemap::FiemapQuery;
using sparsemap::QueryStatus;
using sparsemap::ValidationException;

QueryStatus sparsemap::MapExtents(
    const utils::LinuxFile& File,
    std::vector<Extent>*    Extents,
    uint64_t                Start,
    uint64_t                Length,
    uint32_t                Flags)
{
    Extents->clear();

    // first byte past the requested range, UINT64_MAX stands for "to the end of the file"
    const uint64_t stop = (Length > UINT64_MAX - Start) ? UINT64_MAX : Start + Length;

    uint64_t next  = Start;
    uint32_t pages = 0;

    while (next < stop)
    {
        FiemapQuery query(next, (UINT64_MAX == stop) ? FIEMAP_WHOLE_FILE : stop - next, Flags);

        if (QueryStatus::UnsupportedFilesystem == query.Execute(File))
        {
            if (0 != pages)
            {
                // the filesystem answered the first page, it can't stop supporting fiemap midway
                throw ValidationException("FS_IOC_FIEMAP became unsupported while paging");
            }
            return QueryStatus::UnsupportedFilesystem;
        }
        ++pages;

        for (uint32_t i = 0; i < query.GetMappedCount(); ++i)
        {
            Extent extent = query.GetExtent(i);

            if (!Extents->empty() && extent.GetLogicalOffset() < Extents->back().GetLogicalEnd())
            {
                spdlog::error(
                    "\"{}\": extent at {} overlaps the previous one ending at {} (page {})",
                    File.GetFilePath(),
                    extent.GetLogicalOffset(),
                    Extents->back().GetLogicalEnd(),
                    pages);
                throw ValidationException("FS_IOC_FIEMAP returned overlapping or unordered extents");
            }

            Extents->push_back(extent);
        }

        if (!query.IsPossiblyTruncated())
        {
            break;
        }

        uint64_t continuation = query.GetContinuationOffset();
        if (continuation <= next)
        {
            throw ValidationException("FS_IOC_FIEMAP continuation does not advance");
        }

        spdlog::debug("\"{}\": page {} full, continuing at {}", File.GetFilePath(), pages, continuation);
        next = continuation;
    }

    spdlog::debug("\"{}\": {} extents in {} pages", File.GetFilePath(), Extents->size(), pages);

    return QueryStatus::Mapped;
}
