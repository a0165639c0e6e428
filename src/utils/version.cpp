#include "version.h"

const char* getSlidecastVersion() {
    #ifdef SLIDECAST_VERSION
    // SLIDECAST_VERSION is defined at compile time by the build
    return SLIDECAST_VERSION;
    #else
    // Fallback: build-time date/time macros
    // __DATE__ format: "MMM DD YYYY", __TIME__ format: "HH:MM:SS"
    return "dev-" __DATE__ "-" __TIME__;
    #endif
}
