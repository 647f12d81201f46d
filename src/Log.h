#pragma once

#include <stdio.h>

// Print-style log port. Same call shape as Serial on the firmware builds,
// but writes to stderr so stdout stays free for the text chart.
class LogPort {
public:
    explicit LogPort(FILE* stream);

    size_t printf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    size_t print(const char* msg);
    size_t println(const char* msg = "");

    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

private:
    FILE* stream_;
    bool enabled_ = true;
};

extern LogPort Log;
