#include "Log.h"

#include <stdarg.h>
#include <string.h>

LogPort Log(stderr);

LogPort::LogPort(FILE* stream)
: stream_(stream) {}

size_t LogPort::printf(const char* fmt, ...)
{
    if (!enabled_ || !stream_) return 0;

    va_list args;
    va_start(args, fmt);
    int n = vfprintf(stream_, fmt, args);
    va_end(args);

    return (n > 0) ? static_cast<size_t>(n) : 0;
}

size_t LogPort::print(const char* msg)
{
    if (!enabled_ || !stream_ || !msg) return 0;
    return fwrite(msg, 1, strlen(msg), stream_);
}

size_t LogPort::println(const char* msg)
{
    size_t n = print(msg);
    if (enabled_ && stream_) {
        fputc('\n', stream_);
        fflush(stream_);
        ++n;
    }
    return n;
}
