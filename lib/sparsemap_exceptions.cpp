#include "sparsemap_exceptions.hpp"

#include <cstring> // strerror

using sparsemap::ErrnoException;
using sparsemap::SparsemapException;
using sparsemap::ValidationException;

namespace {
    // "<message>: <strerror>", or just the message when there is no errno
    std::string FormatErrno(const std::string& Message, int Errno)
    {
        if (Errno <= 0)
        {
            return Message;
        }
        return Message + ": " + strerror(Errno);
    }
} // namespace

SparsemapException::SparsemapException(std::string Message) noexcept
    : m_message(std::move(Message))
{}

const char* SparsemapException::what() const noexcept
{
    return m_message.c_str();
}

ErrnoException::ErrnoException(const std::string& Message, const int Errno)
    : SparsemapException(FormatErrno(Message, Errno))
    , m_errno(Errno)
{}

ErrnoException::ErrnoException(const char* const Message, const int Errno)
    : ErrnoException(std::string(Message), Errno)
{}

int ErrnoException::GetErrno() const noexcept
{
    return m_errno;
}

ValidationException::ValidationException(const char* const Message)
    : SparsemapException(std::string(Message))
{}

ValidationException::ValidationException(std::string Message) noexcept
    : SparsemapException(std::move(Message))
{}
