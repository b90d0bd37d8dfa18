#ifndef _LINUX_FILE_HPP_
#define _LINUX_FILE_HPP_

#include "sparsemap_exceptions.hpp" // sparsemap::ErrnoException

#include <sys/types.h> // off_t mode_t

#include <cstdint> // uint64_t
#include <string>  // std::string

namespace sparsemap::utils {
    class LinuxFile;
    class LinuxFileException;
} // namespace sparsemap::utils

class sparsemap::utils::LinuxFile
{
public:
    LinuxFile();
    // opens existing file
    explicit LinuxFile(const std::string& FilePath);
    explicit LinuxFile(const std::string& FilePath, int Flags);
    explicit LinuxFile(const std::string& FilePath, int Flags, mode_t Mode);
    explicit LinuxFile(const std::string& FilePath, bool Create, bool ReadOnly);

    LinuxFile(const LinuxFile&);
    LinuxFile& operator=(const LinuxFile&);

    LinuxFile(LinuxFile&&) noexcept;
    LinuxFile& operator=(LinuxFile&&) noexcept;

    virtual ~LinuxFile() noexcept;

    size_t ReadFromOffset(void* Buffer, off_t Offset, uint64_t Size) const;

    size_t WriteAtOffset(const void* Buffer, off_t Offset, uint64_t Size) const;

    // read/write at the current cursor position, moving the cursor
    size_t Read(void* Buffer, uint64_t Size) const;
    size_t Write(const void* Buffer, uint64_t Size) const;

    void Flush() const;

    // grows (sparsely) or shrinks the file to Size bytes
    void Truncate(off_t Size) const;

    const std::string& GetFilePath() const noexcept;

    void Delete();
    void PreAllocate(off_t Offset, off_t Size) const;

    bool IsOpen() const noexcept;

    int      GetDescriptor() const noexcept;
    uint64_t GetBlocksize() const;
    off_t    GetFileSize() const;

    void Close();

private:
    int         m_Descriptor;
    std::string m_AbsolutePath;
};

class sparsemap::utils::LinuxFileException : public ErrnoException
{
public:
    explicit LinuxFileException(const char* Message, int Errno);
    explicit LinuxFileException(const char* Message);
};

#endif // !_LINUX_FILE_HPP_
