#ifndef _EXTENT_HPP_
#define _EXTENT_HPP_

#include "fiemap_record.hpp" // sparsemap::FiemapExtentRecord

#include <cstdint> // uint32_t uint64_t
#include <string>  // std::string

namespace sparsemap {
    class Extent;
} // namespace sparsemap

/*
 * One contiguous allocated run of a file, as reported by FS_IOC_FIEMAP.
 *
 * Offsets and length are in bytes. The flags are the filesystem's FIEMAP_EXTENT_* bits and are
 * passed through untouched; the helpers below only test them.
 */
class sparsemap::Extent
{
public:
    Extent(uint64_t LogicalOffset, uint64_t PhysicalOffset, uint64_t Length, uint32_t Flags) noexcept;

    // ctor from the kernel's extent entry
    explicit Extent(const FiemapExtentRecord& Record) noexcept;

    [[nodiscard]] inline uint64_t GetLogicalOffset() const noexcept
    {
        return m_logicalOffset;
    }

    [[nodiscard]] inline uint64_t GetPhysicalOffset() const noexcept
    {
        return m_physicalOffset;
    }

    [[nodiscard]] inline uint64_t GetLength() const noexcept
    {
        return m_length;
    }

    [[nodiscard]] inline uint32_t GetFlags() const noexcept
    {
        return m_flags;
    }

    // first logical byte past the extent, saturated at UINT64_MAX
    [[nodiscard]] uint64_t GetLogicalEnd() const noexcept;

    [[nodiscard]] bool HasFlags(uint32_t Flags) const noexcept;

    [[nodiscard]] bool IsLast() const noexcept;
    [[nodiscard]] bool IsUnknown() const noexcept;
    [[nodiscard]] bool IsDelalloc() const noexcept;
    [[nodiscard]] bool IsUnwritten() const noexcept;
    [[nodiscard]] bool IsShared() const noexcept;
    [[nodiscard]] bool IsNotAligned() const noexcept;

    // true if the extent has at least one byte inside [Offset, Offset + Length)
    [[nodiscard]] bool Overlaps(uint64_t Offset, uint64_t Length) const noexcept;

    bool operator==(const Extent& Other) const noexcept;
    bool operator!=(const Extent& Other) const noexcept;

private:
    uint64_t m_logicalOffset;  /* logical start, bytes */
    uint64_t m_physicalOffset; /* physical start, bytes */
    uint64_t m_length;         /* bytes */
    uint32_t m_flags;          /* FIEMAP_EXTENT_* */
};

namespace sparsemap {
    // "LAST|UNWRITTEN|0x10000", "NONE" for zero
    std::string ExtentFlagsToString(uint32_t Flags);
} // namespace sparsemap

#endif // !_EXTENT_HPP_
