////////////////////////////////////////////////////////////////////////////////
//
// core/error.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/error.hpp>
#include <isom/stddef.hpp>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <new>
#include <string>
#include <system_error>


namespace isom {

char const* error_message(errc const e) noexcept
{
    switch (e) {
    case errc::out_of_bounds:       return "index out of bounds";
    case errc::file_not_found:      return "file not found";
    case errc::access_denied:       return "access denied";
    case errc::read_fault:          return "read error";
    case errc::end_of_file:         return "unexpected end of data";
    case errc::invalid_argument:    return "invalid argument";
    case errc::invalid_data_format: return "malformed data";
    case errc::unsupported_format:  return "unsupported format";
    }
    return "unknown error";
}

void raise(errc const e)
{
    throw isom::error{e, error_message(e)};
}

void raise(errc const e, char const* const format, ...)
{
    std::string msg{error_message(e)};
    msg += ": ";

    va_list args;
    va_start(args, format);

    va_list copy;
    va_copy(copy, args);
    auto const n = std::vsnprintf(nullptr, 0, format, copy);
    va_end(copy);

    if (n > 0) {
        auto const prefix = msg.size();
        msg.resize(prefix + static_cast<std::size_t>(n) + 1);
        std::vsnprintf(&msg[prefix], static_cast<std::size_t>(n) + 1,
                       format, args);
        msg.pop_back();
    }
    va_end(args);

    if (n < 0) {
        msg += format;
    }
    throw isom::error{e, msg};
}

void raise_bad_alloc()
{
    throw std::bad_alloc{};
}

void raise_current_system_error()
{
    throw std::system_error{errno, std::system_category()};
}

}     // namespace isom
