#include "position_prober.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h> // lseek

#include <cerrno>
#include <cstdint>
#include <cstring>   // strerror
#include <limits>    // std::numeric_limits
#include <stdexcept> // std::logic_error

using sparsemap::SeekException;
using sparsemap::SeekOffset;
using sparsemap::utils::LinuxFile;

namespace {
    const char* WhenceName(int Whence) noexcept
    {
        switch (Whence)
        {
        case SEEK_SET:
            return "SEEK_SET";
        case SEEK_CUR:
            return "SEEK_CUR";
        case SEEK_DATA:
            return "SEEK_DATA";
        case SEEK_HOLE:
            return "SEEK_HOLE";
        default:
            return "SEEK_?";
        }
    }

    SeekOffset Seek(const LinuxFile& File, uint64_t Offset, int Whence)
    {
        if (Offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max()))
        {
            spdlog::debug("{} {} on \"{}\" is past the addressable region", WhenceName(Whence), Offset, File.GetFilePath());
            return SeekOffset::EndOfRegion();
        }

        off_t result = lseek(File.GetDescriptor(), static_cast<off_t>(Offset), Whence);
        if (-1 == result)
        {
            int err = errno;

            if (ENXIO == err)
            {
                return SeekOffset::EndOfRegion();
            }

            spdlog::error(
                "lseek {} {} \"{}\"({}) failed: {}",
                WhenceName(Whence),
                Offset,
                File.GetFilePath(),
                File.GetDescriptor(),
                strerror(err));
            throw SeekException("lseek", err);
        }

        return SeekOffset::At(static_cast<uint64_t>(result));
    }
} // namespace

SeekOffset sparsemap::SeekTo(const LinuxFile& File, uint64_t Offset)
{
    return Seek(File, Offset, SEEK_SET);
}

SeekOffset sparsemap::SeekToData(const LinuxFile& File, uint64_t Offset)
{
    return Seek(File, Offset, SEEK_DATA);
}

SeekOffset sparsemap::SeekToHole(const LinuxFile& File, uint64_t Offset)
{
    return Seek(File, Offset, SEEK_HOLE);
}

uint64_t sparsemap::GetCursor(const LinuxFile& File)
{
    off_t result = lseek(File.GetDescriptor(), 0, SEEK_CUR);
    if (-1 == result)
    {
        int err = errno;
        spdlog::error("lseek SEEK_CUR \"{}\"({}) failed: {}", File.GetFilePath(), File.GetDescriptor(), strerror(err));
        throw SeekException("lseek", err);
    }
    return static_cast<uint64_t>(result);
}

SeekOffset::SeekOffset(bool EndOfRegion, uint64_t Offset) noexcept
    : m_endOfRegion(EndOfRegion)
    , m_offset(Offset)
{}

SeekOffset SeekOffset::At(uint64_t Offset) noexcept
{
    return SeekOffset(false, Offset);
}

SeekOffset SeekOffset::EndOfRegion() noexcept
{
    return SeekOffset(true, 0);
}

uint64_t SeekOffset::GetOffset() const
{
    if (m_endOfRegion)
    {
        throw std::logic_error("end of region has no offset");
    }
    return m_offset;
}

bool SeekOffset::operator==(const SeekOffset& Other) const noexcept
{
    return m_endOfRegion == Other.m_endOfRegion && m_offset == Other.m_offset;
}

bool SeekOffset::operator!=(const SeekOffset& Other) const noexcept
{
    return !(*this == Other);
}

SeekException::SeekException(const char* const Message, const int Errno)
    : ErrnoException(Message, Errno)
{}
