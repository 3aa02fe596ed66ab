////////////////////////////////////////////////////////////////////////////////
//
// isom/error.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_9F3B6E1A_25D7_4C80_B4E9_6A0C8D5F12B7
#define ISOM_INCLUDED_9F3B6E1A_25D7_4C80_B4E9_6A0C8D5F12B7


#include <isom/stddef.hpp>

#include <stdexcept>
#include <string>


namespace isom {

// HRESULT-compatible error codes.
enum class errc : uint32 {
    out_of_bounds          = 0x8000000b,
    file_not_found         = 0x80070002,
    access_denied          = 0x80070005,
    read_fault             = 0x8007001e,
    end_of_file            = 0x80070026,
    invalid_argument       = 0x80070057,
    invalid_data_format    = 0x83760002,
    unsupported_format     = 0x88890008,
};


class error :
    public std::runtime_error
{
public:
    error(errc const e, std::string const& what) :
        std::runtime_error{what},
        code_{e}
    {}

    errc code() const noexcept
    { return code_; }

private:
    errc code_;
};


ISOM_EXPORT
char const* error_message(errc) noexcept;

[[noreturn]] ISOM_EXPORT
void raise(errc);

// Throws an isom::error whose message is the generic text for the code
// followed by the formatted detail.
[[noreturn]] ISOM_EXPORT ISOM_PRINTF_FORMAT(2, 3)
void raise(errc, char const*, ...);

[[noreturn]] ISOM_EXPORT
void raise_bad_alloc();

// Throws std::system_error for the current 'errno'.
[[noreturn]] ISOM_EXPORT
void raise_current_system_error();

}     // namespace isom


#endif  // ISOM_INCLUDED_9F3B6E1A_25D7_4C80_B4E9_6A0C8D5F12B7
