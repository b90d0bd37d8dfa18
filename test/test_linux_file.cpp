#include "linux_file.hpp"

#include "gtest/gtest.h"
#include "testing_sparsemap.hpp"

#include <fcntl.h>

#include <cerrno>
#include <string>
#include <utility>

using sparsemap::utils::LinuxFile;
using sparsemap::utils::LinuxFileException;
using testing_sparsemap::ScratchDirTest;

namespace {
    class LinuxFileTest : public ScratchDirTest
    {};
} // namespace

TEST_F(LinuxFileTest, OpenMissingFileFails)
{
    try
    {
        LinuxFile file(PathOf("missing.bin"));
        FAIL() << "expected LinuxFileException";
    }
    catch (const LinuxFileException& exc)
    {
        EXPECT_EQ(ENOENT, exc.GetErrno());
        EXPECT_NE(std::string::npos, std::string(exc.what()).find("open"));
    }
}

TEST_F(LinuxFileTest, TruncateGrowsWithoutWriting)
{
    LinuxFile file = CreateSparseFile("grow.bin", 3 * 4096);
    EXPECT_EQ(3 * 4096, file.GetFileSize());
    EXPECT_GT(file.GetBlocksize(), 0u);

    file.Truncate(100);
    EXPECT_EQ(100, file.GetFileSize());
}

TEST_F(LinuxFileTest, OffsetAndCursorIo)
{
    LinuxFile file = CreateSparseFile("io.bin", 0);

    const std::string hello = "hello";
    ASSERT_EQ(hello.size(), file.Write(hello.data(), hello.size()));
    ASSERT_EQ(3u, file.WriteAtOffset("XYZ", 10, 3));
    EXPECT_EQ(13, file.GetFileSize());

    char buffer[13] = {};
    ASSERT_EQ(sizeof(buffer), file.ReadFromOffset(buffer, 0, sizeof(buffer)));
    EXPECT_EQ(std::string("hello\0\0\0\0\0XYZ", 13), std::string(buffer, sizeof(buffer)));

    // the cursor is past "hello", positional writes did not move it
    char tail[8] = {};
    ASSERT_EQ(8u, file.Read(tail, sizeof(tail)));
    EXPECT_EQ('Z', tail[7]);
}

TEST_F(LinuxFileTest, CopyAndMove)
{
    LinuxFile original = CreateSparseFile("copy.bin", 42);
    EXPECT_NE(std::string::npos, original.GetFilePath().find("copy.bin"));

    LinuxFile copy(original);
    EXPECT_TRUE(copy.IsOpen());
    EXPECT_NE(original.GetDescriptor(), copy.GetDescriptor());
    EXPECT_EQ(original.GetFilePath(), copy.GetFilePath());
    EXPECT_EQ(42, copy.GetFileSize());

    LinuxFile moved(std::move(copy));
    EXPECT_TRUE(moved.IsOpen());
    EXPECT_FALSE(copy.IsOpen()); // NOLINT(bugprone-use-after-move)

    moved.Close();
    EXPECT_FALSE(moved.IsOpen());
    EXPECT_TRUE(moved.GetFilePath().empty());

    LinuxFile closed;
    EXPECT_THROW(LinuxFile{closed}, LinuxFileException);
}

TEST_F(LinuxFileTest, DeleteRemovesTheFile)
{
    LinuxFile file = CreateSparseFile("delete.bin", 1);
    const std::string path = file.GetFilePath();

    file.Delete();
    EXPECT_FALSE(file.IsOpen());
    EXPECT_THROW(LinuxFile{path}, LinuxFileException);
}
