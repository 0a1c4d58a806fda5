#pragma once

#ifdef _WIN32
    #define SBRIDGE_PLATFORM_WINDOWS
    #include <windows.h>
#else
    #define SBRIDGE_PLATFORM_POSIX
    #include <termios.h>
    #include <unistd.h>
#endif

namespace sbridge {

enum class Platform {
    Windows,
    Posix
};

inline Platform get_platform() {
#ifdef SBRIDGE_PLATFORM_WINDOWS
    return Platform::Windows;
#else
    return Platform::Posix;
#endif
}

inline const char* platform_name() {
    switch (get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::Posix: return "POSIX";
    }
    return "Unknown";
}

/// Device name used when neither the config file nor the command line names one
inline const char* default_serial_device() {
#ifdef SBRIDGE_PLATFORM_WINDOWS
    return "COM3";
#else
    return "/dev/ttyUSB0";
#endif
}

} // namespace sbridge
