#ifndef VERSION_H
#define VERSION_H

/**
 * Get the slidecast version string
 * @return Version string (e.g., "v1.2.3" or "dev-Jan 01 2024-12:00:00")
 */
const char* getSlidecastVersion();

#endif // VERSION_H
