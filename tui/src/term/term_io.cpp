// tui/src/term/term_io.cpp
// @brief Standard-output TermIO implementation.
// @invariant flush() retries short writes until every byte is written or the
//            descriptor reports an unrecoverable error.
// @ownership RealTermIO buffers bytes until flush().

#include "tui/term/term_io.hpp"

#include <cerrno>
#include <cstdio>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace stagelens::tui::term
{

void RealTermIO::write(std::string_view s)
{
    pending_.append(s);
}

void RealTermIO::flush()
{
#if defined(_WIN32)
    std::fwrite(pending_.data(), 1, pending_.size(), stdout);
    std::fflush(stdout);
#else
    const char *p = pending_.data();
    size_t left = pending_.size();
    while (left > 0)
    {
        ssize_t n = ::write(STDOUT_FILENO, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
#endif
    pending_.clear();
}

} // namespace stagelens::tui::term
