// Cross-platform setenv/unsetenv for tests that toggle WEFT_* flags.

#include "test_env.hpp"
#include "weft/config.hpp"
#include <cstdlib>
#include <string>

void set_env(const char* name, const char* value)
{
#if defined(_WIN32)
    std::string assignment = std::string(name) + "=" + (value ? value : "");
    _putenv(assignment.c_str());
#else
    if (!value || !*value) ::unsetenv(name);
    else ::setenv(name, value, 1);
#endif
    weft::refresh_trace_env();
}
