#include "linux_file.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <limits.h> // PATH_MAX
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>  // remove
#include <cstring> // strerror
#include <string>
#include <utility> // std::swap

using sparsemap::ErrnoException;
using sparsemap::utils::LinuxFile;
using sparsemap::utils::LinuxFileException;

LinuxFile::LinuxFile()
    : m_Descriptor(-1)
    , m_AbsolutePath()
{}

LinuxFile::LinuxFile(const std::string& Path)
    : LinuxFile(Path, O_RDWR | O_CLOEXEC)
{}

LinuxFile::LinuxFile(const std::string& Path, int Flags)
    : LinuxFile(Path, Flags, 0)
{}

LinuxFile::LinuxFile(const std::string& Path, int Flags, mode_t Mode)
{
    // open the file
    if (-1 == (m_Descriptor = open(Path.c_str(), Flags, Mode)))
    {
        int err = errno;
        spdlog::error("open \"{}\" failed: {}", Path.c_str(), strerror(err));
        throw LinuxFileException("open", err);
    }

    // read the symlink to get the absolute path
    std::string fdlink                = "/proc/self/fd/" + std::to_string(m_Descriptor);
    char        fullpath[PATH_MAX + 1] = {};

    ssize_t length = readlink(fdlink.c_str(), fullpath, PATH_MAX);
    if (-1 == length)
    {
        int err = errno;
        spdlog::error("readlink \"{}\" failed: {}", fdlink.c_str(), strerror(err));
        close(m_Descriptor);
        m_Descriptor = -1;
        throw LinuxFileException("readlink", err);
    }

    m_AbsolutePath.assign(fullpath, static_cast<size_t>(length));
}

LinuxFile::LinuxFile(const std::string& FilePath, bool Create, bool ReadOnly)
    : LinuxFile(FilePath, O_CLOEXEC | (Create ? O_CREAT : 0) | (ReadOnly ? O_RDONLY : O_RDWR), S_IRUSR | S_IWUSR)
{}

LinuxFile::LinuxFile(const LinuxFile& Other)
    : LinuxFile()
{
    *this = Other;
}

LinuxFile& LinuxFile::operator=(const LinuxFile& Other)
{
    if (this != &Other) // bypass self-assignment
    {
        if (!Other.IsOpen())
        {
            spdlog::error("File \"{}\"({}) is not open", Other.GetFilePath().c_str(), Other.GetDescriptor());
            throw LinuxFileException("File is not open");
        }

        Close();

        // the duplicate shares the cursor with the original
        m_Descriptor = fcntl(Other.m_Descriptor, F_DUPFD_CLOEXEC, 0);
        if (m_Descriptor < 0)
        {
            int err = errno;
            spdlog::error(
                "Failed to duplicate file \"{}\"({}). Error: {}",
                Other.GetFilePath().c_str(),
                Other.GetDescriptor(),
                strerror(err));
            throw LinuxFileException("Failed to duplicate file", err);
        }

        m_AbsolutePath = Other.m_AbsolutePath;
    }

    return *this;
}

LinuxFile::LinuxFile(LinuxFile&& Other) noexcept
    : LinuxFile()
{
    std::swap(m_Descriptor, Other.m_Descriptor);
    std::swap(m_AbsolutePath, Other.m_AbsolutePath);
}

LinuxFile& LinuxFile::operator=(LinuxFile&& Other) noexcept
{
    if (this != &Other) // bypass self-assignment
    {
        std::swap(m_Descriptor, Other.m_Descriptor);
        std::swap(m_AbsolutePath, Other.m_AbsolutePath);
    }
    return *this;
}

LinuxFile::~LinuxFile() noexcept
{
    try
    {
        Close();
    }
    catch (const std::exception& exc)
    {
        spdlog::error("~LinuxFile failed: {}", exc.what());
    }
}

size_t LinuxFile::ReadFromOffset(void* Buffer, off_t Offset, uint64_t Size) const
{
    ssize_t bytesRead = 0;
    if (0 > (bytesRead = pread(m_Descriptor, Buffer, Size, Offset)))
    {
        int err = errno;
        spdlog::error("pread \"{}\"({}) failed: {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(err));
        throw LinuxFileException("Failed to read from file", err);
    }
    return static_cast<size_t>(bytesRead);
}

size_t LinuxFile::WriteAtOffset(const void* Buffer, off_t Offset, uint64_t Size) const
{
    ssize_t bytesWritten = 0;
    if (0 > (bytesWritten = pwrite(m_Descriptor, Buffer, Size, Offset)))
    {
        int err = errno;
        spdlog::error("pwrite \"{}\"({}) failed: {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(err));
        throw LinuxFileException("Failed to write to file", err);
    }
    return static_cast<size_t>(bytesWritten);
}

size_t LinuxFile::Read(void* Buffer, uint64_t Size) const
{
    ssize_t bytesRead = 0;
    if (0 > (bytesRead = read(m_Descriptor, Buffer, Size)))
    {
        int err = errno;
        spdlog::error("read \"{}\"({}) failed: {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(err));
        throw LinuxFileException("Failed to read from file", err);
    }
    return static_cast<size_t>(bytesRead);
}

size_t LinuxFile::Write(const void* Buffer, uint64_t Size) const
{
    ssize_t bytesWritten = 0;
    if (0 > (bytesWritten = write(m_Descriptor, Buffer, Size)))
    {
        int err = errno;
        spdlog::error("write \"{}\"({}) failed: {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(err));
        throw LinuxFileException("Failed to write to file", err);
    }
    return static_cast<size_t>(bytesWritten);
}

void LinuxFile::Flush() const
{
    if (0 != fsync(m_Descriptor))
    {
        int err = errno;
        spdlog::error("fsync \"{}\"({}): {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(err));
        throw LinuxFileException("fsync", err);
    }
}

void LinuxFile::Truncate(off_t Size) const
{
    if (0 != ftruncate(m_Descriptor, Size))
    {
        int err = errno;
        spdlog::error("ftruncate \"{}\"({}) to {} failed: {}", m_AbsolutePath.c_str(), m_Descriptor, Size, strerror(err));
        throw LinuxFileException("ftruncate", err);
    }
}

const std::string& LinuxFile::GetFilePath() const noexcept
{
    return m_AbsolutePath;
}

void LinuxFile::Delete()
{
    std::string path = m_AbsolutePath; // save the path, Close() clears it

    Close();

    if (0 != remove(path.c_str()))
    {
        int err = errno;
        spdlog::error("remove \"{}\" failed: {}", path.c_str(), strerror(err));
        throw LinuxFileException("remove", err);
    }
}

void LinuxFile::PreAllocate(off_t Offset, off_t Size) const
{
    int status = 0;
    if (0 != (status = posix_fallocate(m_Descriptor, Offset, Size)))
    {
        spdlog::error("posix_fallocate \"{}\"({}): {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(status));
        throw LinuxFileException("posix_fallocate", status);
    }
}

int LinuxFile::GetDescriptor() const noexcept
{
    return m_Descriptor;
}

uint64_t LinuxFile::GetBlocksize() const
{
    struct stat stat = {};

    if (-1 == fstat(m_Descriptor, &stat))
    {
        int err = errno;
        spdlog::error("fstat \"{}\"({}) failed: {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(err));
        throw LinuxFileException("fstat GetBlocksize", err);
    }

    return static_cast<uint64_t>(stat.st_blksize);
}

off_t LinuxFile::GetFileSize() const
{
    struct stat stat = {};

    if (-1 == fstat(m_Descriptor, &stat))
    {
        int err = errno;
        spdlog::error("fstat \"{}\"({}) failed: {}", m_AbsolutePath.c_str(), m_Descriptor, strerror(err));
        throw LinuxFileException("fstat GetFileSize", err);
    }

    return stat.st_size;
}

bool LinuxFile::IsOpen() const noexcept
{
    return m_Descriptor != -1;
}

void LinuxFile::Close()
{
    if (IsOpen())
    {
        int descriptor = m_Descriptor;

        // the descriptor is gone even when close() reports an error
        m_Descriptor = -1;
        m_AbsolutePath.clear();

        if (-1 == close(descriptor))
        {
            throw LinuxFileException("close", errno);
        }
    }
}

LinuxFileException::LinuxFileException(const char* const Message, const int Err)
    : ErrnoException(Message, Err)
{}

LinuxFileException::LinuxFileException(const char* const Message)
    : ErrnoException(Message, -1)
{}
