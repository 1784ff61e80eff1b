#pragma once

// Tests toggle UPCAST_* settings with the Windows spelling _putenv("NAME=VALUE").
// test_env.cpp supplies it on POSIX; "NAME=" unsets the variable.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif
