#ifndef SQUISHER_MIME_DETECTOR_HPP
#define SQUISHER_MIME_DETECTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace squisher {

    /**
     * @brief Content-based file type detection.
     *
     * Used only to pick an image decoder; classification itself is
     * extension-based and never consults this.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @return e.g. "image/png", or an empty string if detection failed.
         *
         * @note On Linux/macOS this uses libmagic. On Windows it returns an
         * empty string and callers fall back to the extension.
         */
        static std::string detect(const std::vector<std::uint8_t>& data);
    };

} // namespace squisher

#endif // SQUISHER_MIME_DETECTOR_HPP
