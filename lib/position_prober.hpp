#ifndef _POSITION_PROBER_HPP_
#define _POSITION_PROBER_HPP_

#include "linux_file.hpp"           // sparsemap::utils::LinuxFile
#include "sparsemap_exceptions.hpp" // sparsemap::ErrnoException

#include <cstdint> // uint64_t

namespace sparsemap {
    class SeekOffset;
    class SeekException;

    // Absolute seek (SEEK_SET). Offsets that do not fit in off_t are past the addressable
    // region and come back as the end-of-region marker without touching the cursor.
    [[nodiscard]] SeekOffset SeekTo(const utils::LinuxFile& File, uint64_t Offset);

    // SEEK_DATA: next byte at or after Offset that is backed by data.
    [[nodiscard]] SeekOffset SeekToData(const utils::LinuxFile& File, uint64_t Offset);

    // SEEK_HOLE: next hole at or after Offset; the end of the file counts as a hole.
    [[nodiscard]] SeekOffset SeekToHole(const utils::LinuxFile& File, uint64_t Offset);

    // current cursor position (SEEK_CUR with a zero offset)
    [[nodiscard]] uint64_t GetCursor(const utils::LinuxFile& File);
} // namespace sparsemap

/*
 * Outcome of one lseek(): the new cursor position, or "nothing at or after the target" (ENXIO).
 */
class sparsemap::SeekOffset
{
public:
    [[nodiscard]] static SeekOffset At(uint64_t Offset) noexcept;
    [[nodiscard]] static SeekOffset EndOfRegion() noexcept;

    [[nodiscard]] inline bool IsEndOfRegion() const noexcept
    {
        return m_endOfRegion;
    }

    // throws std::logic_error on the end-of-region marker
    [[nodiscard]] uint64_t GetOffset() const;

    bool operator==(const SeekOffset& Other) const noexcept;
    bool operator!=(const SeekOffset& Other) const noexcept;

private:
    SeekOffset(bool EndOfRegion, uint64_t Offset) noexcept;

    bool     m_endOfRegion;
    uint64_t m_offset;
};

class sparsemap::SeekException : public ErrnoException
{
public:
    explicit SeekException(const char* Message, int Errno);
};

#endif // !_POSITION_PROBER_HPP_
