#include <pdfscrub/ScrubExc.hh>

using namespace pdfscrub;

ScrubExc::ScrubExc(
    pdfscrub_error_code_e error_code, std::string const& filename, std::string const& message) :
    std::runtime_error(createWhat(filename, message)),
    error_code(error_code),
    filename(filename),
    message(message)
{
}

std::string
ScrubExc::createWhat(std::string const& filename, std::string const& message)
{
    std::string result;
    if (!filename.empty()) {
        result += filename;
        result += ": ";
    }
    result += message;
    return result;
}

pdfscrub_error_code_e
ScrubExc::getErrorCode() const
{
    return error_code;
}

std::string const&
ScrubExc::getFilename() const
{
    return filename;
}

std::string const&
ScrubExc::getMessageDetail() const
{
    return message;
}

char const*
ScrubExc::describe(pdfscrub_error_code_e code)
{
    switch (code) {
    case pdfscrub_e_success:
        return "success";
    case pdfscrub_e_input_not_found:
        return "input not found";
    case pdfscrub_e_password:
        return "password protected";
    case pdfscrub_e_structure:
        return "structural error";
    case pdfscrub_e_output:
        return "output write error";
    case pdfscrub_e_invocation:
        return "invalid invocation";
    }
    return "unknown error";
}
