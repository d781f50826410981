#include "tcptx/common.hpp"

#include <system_error>

using namespace tcptx;

std::string tcptx::SocketErrorMessage(int error, const bool gaiStrerror /* = false */)
{
    // 0 means "no error" in both errno and WSA error spaces.
    if (error == 0)
        return {};

    // Some APIs return negative errno-like values; normalize to positive for lookups.
    // glibc EAI_* codes are negative by definition and must reach gai_strerror() unchanged.
    if (error < 0 && !gaiStrerror)
        error = -error;

#ifdef _WIN32
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerrorA(error); m && *m)
            return {m}; // copy immediately (gai_strerrorA uses a static buffer)
    }

    {
        LPSTR buffer = nullptr;
        constexpr DWORD flags =
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS;
        constexpr DWORD lang = MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT);

        const DWORD size = ::FormatMessageA(flags, nullptr, static_cast<DWORD>(error), lang,
                                            reinterpret_cast<LPSTR>(&buffer), 0, nullptr);

        if (size != 0 && buffer)
        {
            std::string msg(buffer, size);
            ::LocalFree(buffer);

            // FormatMessage appends CR/LF and sometimes a trailing period.
            while (!msg.empty() && (msg.back() == '\r' || msg.back() == '\n' || msg.back() == ' ' || msg.back() == '.'))
            {
                msg.pop_back();
            }

            if (!msg.empty())
                return msg;
        }
    }

    try
    {
        if (std::string m = std::system_category().message(error); !m.empty())
            return m;
    }
    catch (const std::exception&)
    {
        // fall through to strerror_s
    }

    {
        char buf[256] = {};
        if (::strerror_s(buf, sizeof buf, error) == 0 && buf[0] != '\0')
            return {buf};
    }

    return "Unknown error " + std::to_string(error);

#else
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerror(error); m && *m)
            return {m};
        if (error < 0)
            error = -error;
    }

    try
    {
        std::string m = std::system_category().message(error);
        if (!m.empty())
            return m;
    }
    catch (const std::exception&)
    {
        // fall through to strerror
    }

    if (const char* m = ::strerror(error); m && *m)
        return {m};

    return "Unknown error " + std::to_string(error);
#endif
}
