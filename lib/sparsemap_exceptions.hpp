#ifndef _SPARSEMAP_EXCEPTIONS_HPP_
#define _SPARSEMAP_EXCEPTIONS_HPP_

#include <exception> // std::exception
#include <string>    // std::string

namespace sparsemap {
    // root of everything thrown by the library
    class SparsemapException;

    // a system call failed, errno is kept for the caller
    class ErrnoException;

    // the kernel handed back something that breaks the extent map invariants
    class ValidationException;
} // namespace sparsemap

class sparsemap::SparsemapException : public std::exception
{
public:
    explicit SparsemapException(std::string Message) noexcept;
    [[nodiscard]] const char* what() const noexcept override;

private:
    const std::string m_message;
};

class sparsemap::ErrnoException : public SparsemapException
{
public:
    ErrnoException(const std::string& Message, int Errno);
    ErrnoException(const char* Message, int Errno);

    [[nodiscard]] int GetErrno() const noexcept;

private:
    const int m_errno;
};

class sparsemap::ValidationException : public SparsemapException
{
public:
    explicit ValidationException(const char* Message);
    explicit ValidationException(std::string Message) noexcept;
};

#endif // !_SPARSEMAP_EXCEPTIONS_HPP_
