#include "position_prober.hpp"

#include "gtest/gtest.h"
#include "testing_sparsemap.hpp"

#include <fcntl.h>
#include <unistd.h> // sysconf

#include <cerrno>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using sparsemap::SeekException;
using sparsemap::SeekOffset;
using sparsemap::SeekTo;
using sparsemap::SeekToData;
using sparsemap::SeekToHole;
using sparsemap::utils::LinuxFile;
using testing_sparsemap::ScratchDirTest;

namespace {
    class PositionProberTest : public ScratchDirTest
    {
    protected:
        // a small, fully written file holding "0123456789"
        LinuxFile CreateDigitsFile()
        {
            const std::string digits = "0123456789";

            LinuxFile file = CreateSparseFile("digits.bin", 0);
            EXPECT_EQ(digits.size(), file.WriteAtOffset(digits.data(), 0, digits.size()));
            return file;
        }
    };
} // namespace

TEST(SeekOffset, EndOfRegionHasNoOffset)
{
    SeekOffset end = SeekOffset::EndOfRegion();

    EXPECT_TRUE(end.IsEndOfRegion());
    EXPECT_THROW((void)end.GetOffset(), std::logic_error);
    EXPECT_EQ(SeekOffset::EndOfRegion(), end);
    EXPECT_NE(SeekOffset::At(0), end);
}

TEST(SeekOffset, ConcreteOffset)
{
    SeekOffset at = SeekOffset::At(42);

    EXPECT_FALSE(at.IsEndOfRegion());
    EXPECT_EQ(42u, at.GetOffset());
    EXPECT_EQ(SeekOffset::At(42), at);
    EXPECT_NE(SeekOffset::At(43), at);
}

TEST_F(PositionProberTest, InBoundsSeekLandsOnTheExactByte)
{
    LinuxFile file = CreateDigitsFile();

    for (uint64_t offset : {7u, 0u, 4u, 9u})
    {
        SeekOffset result = SeekTo(file, offset);
        ASSERT_FALSE(result.IsEndOfRegion());
        EXPECT_EQ(offset, result.GetOffset());
        EXPECT_EQ(offset, sparsemap::GetCursor(file));

        char byte = 0;
        ASSERT_EQ(1u, file.Read(&byte, 1));
        EXPECT_EQ(static_cast<char>('0' + offset), byte);
    }
}

TEST_F(PositionProberTest, SeekPastTheAddressableRegionIsEndOfRegion)
{
    LinuxFile file = CreateDigitsFile();

    ASSERT_FALSE(SeekTo(file, 3).IsEndOfRegion());

    EXPECT_TRUE(SeekTo(file, UINT64_MAX).IsEndOfRegion());
    EXPECT_TRUE(SeekTo(file, static_cast<uint64_t>(std::numeric_limits<off_t>::max()) + 1).IsEndOfRegion());

    // nothing was issued, the cursor stays
    EXPECT_EQ(3u, sparsemap::GetCursor(file));
}

TEST_F(PositionProberTest, AbsoluteSeekAtOrPastEndOfFileIsAConcreteOffset)
{
    LinuxFile file = CreateDigitsFile();

    // Linux allows the cursor past the end, the file only grows on a write
    EXPECT_EQ(SeekOffset::At(10), SeekTo(file, 10));
    EXPECT_EQ(SeekOffset::At(4096), SeekTo(file, 4096));
    EXPECT_EQ(10, file.GetFileSize());
}

TEST_F(PositionProberTest, DataAndHoleProbesAtEndOfFileAreEndOfRegion)
{
    LinuxFile file = CreateDigitsFile();

    EXPECT_TRUE(SeekToData(file, 10).IsEndOfRegion());
    EXPECT_TRUE(SeekToHole(file, 10).IsEndOfRegion());
    EXPECT_TRUE(SeekToData(file, 1024 * 1024).IsEndOfRegion());
    EXPECT_TRUE(SeekToHole(file, 1024 * 1024).IsEndOfRegion());
}

TEST_F(PositionProberTest, EndOfFileCountsAsAHole)
{
    LinuxFile file = CreateDigitsFile();

    SeekOffset data = SeekToData(file, 2);
    ASSERT_FALSE(data.IsEndOfRegion());
    EXPECT_EQ(2u, data.GetOffset());

    SeekOffset hole = SeekToHole(file, 2);
    ASSERT_FALSE(hole.IsEndOfRegion());
    EXPECT_EQ(10u, hole.GetOffset());
}

TEST_F(PositionProberTest, DataProbeSkipsLeadingHole)
{
    const uint64_t size   = 1024 * 1024;
    const uint64_t offset = 512 * 1024;

    LinuxFile file = CreateSparseFile("hole_first.bin", static_cast<off_t>(size));
    WriteFill(file, static_cast<off_t>(offset), 4096, 'd');

    // filesystems without hole tracking report the whole file as data
    SeekOffset data = SeekToData(file, 0);
    ASSERT_FALSE(data.IsEndOfRegion());
    EXPECT_LE(data.GetOffset(), offset);

    SeekOffset hole = SeekToHole(file, offset);
    ASSERT_FALSE(hole.IsEndOfRegion());
    EXPECT_GE(hole.GetOffset(), offset + 4096);
    EXPECT_LE(hole.GetOffset(), size);
}

TEST_F(PositionProberTest, SeekingWithinASparseFileStillWorks)
{
    LinuxFile file = CreateSparseFile("sparse.bin", 1024 * 1024);

    SeekOffset result = SeekTo(file, 700 * 1024);
    ASSERT_FALSE(result.IsEndOfRegion());
    EXPECT_EQ(700u * 1024, result.GetOffset());

    // holes read back as zeros
    char byte = 'x';
    ASSERT_EQ(1u, file.Read(&byte, 1));
    EXPECT_EQ('\0', byte);
}

TEST(PositionProber, ClosedFileIsAnOsFailure)
{
    LinuxFile closed;

    try
    {
        (void)SeekTo(closed, 0);
        FAIL() << "expected SeekException";
    }
    catch (const SeekException& exc)
    {
        EXPECT_EQ(EBADF, exc.GetErrno());
    }

    EXPECT_THROW((void)SeekToData(closed, 0), SeekException);
    EXPECT_THROW((void)sparsemap::GetCursor(closed), SeekException);
}

TEST_F(PositionProberTest, MemoryFileProbesFindTheWrittenPage)
{
    const auto page = static_cast<uint64_t>(sysconf(_SC_PAGESIZE));

    LinuxFile file = CreateMemoryFile("position_prober", static_cast<off_t>(64 * page));
    WriteFill(file, static_cast<off_t>(10 * page), 3, 'p');

    EXPECT_EQ(SeekOffset::At(10 * page), SeekToData(file, 0));
    EXPECT_EQ(SeekOffset::At(11 * page), SeekToHole(file, 10 * page));
    EXPECT_EQ(SeekOffset::EndOfRegion(), SeekToData(file, 11 * page));
}

TEST(PositionProber, SeqFileRejectsDataProbesWithEinval)
{
    // procfs seq files only know SEEK_SET and SEEK_CUR
    LinuxFile file("/proc/self/status", O_RDONLY | O_CLOEXEC);

    try
    {
        (void)SeekToData(file, 0);
        FAIL() << "expected SeekException";
    }
    catch (const SeekException& exc)
    {
        EXPECT_EQ(EINVAL, exc.GetErrno());
    }
}
