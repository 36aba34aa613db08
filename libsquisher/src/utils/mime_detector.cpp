#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>

namespace {

#ifndef _WIN32
struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

// a magic_t is not thread-safe, so every call opens its own cookie
unique_magic open_magic() {
    unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return nullptr;
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic.get()), "libmagic");
        return nullptr;
    }
    return magic;
}
#endif

} // namespace

std::string squisher::MimeDetector::detect(const std::vector<std::uint8_t>& data)
{
#ifndef _WIN32
    const auto magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
#else
    (void)data;
    return {};
#endif
}
