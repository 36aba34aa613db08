#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace squisher {

    FILE* open_file(const fs::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts UTF-16 paths; the \\?\ prefix lifts MAX_PATH
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = fs::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    unique_FILE open_for_reading(const fs::path& path) {
        unique_FILE f(open_file(path, "rb"));
        if (!f) {
            throw IoError("cannot open " + path.string() + ": " + std::strerror(errno));
        }
        return f;
    }

    unique_FILE create_new_file(const fs::path& path) {
        // "x" makes fopen fail with EEXIST instead of truncating
        unique_FILE f(open_file(path, "wbx"));
        if (!f) {
            const int err = errno;
            if (err == EEXIST) {
                throw DestinationExistsError(path);
            }
            throw IoError("cannot create " + path.string() + ": " + std::strerror(err));
        }
        return f;
    }

    void finish_file(unique_FILE& file, const fs::path& path) {
        if (!file) return;
        const bool flushed = std::fflush(file.get()) == 0;
        const bool closed = std::fclose(file.release()) == 0;
        if (!flushed || !closed) {
            throw IoError("failed to write " + path.string() + ": " + std::strerror(errno));
        }
    }

    void write_all(FILE* out, const void* data, const std::size_t size, const fs::path& path) {
        if (size == 0) return;
        if (std::fwrite(data, 1, size, out) != size) {
            throw IoError("short write to " + path.string() + ": " + std::strerror(errno));
        }
    }

    void ensure_parent_dirs(const fs::path& path) {
        const auto parent = path.parent_path();
        if (parent.empty()) return;
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec && !fs::is_directory(parent)) {
            throw IoError("cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::vector<std::uint8_t> read_file_bytes(const fs::path& path) {
        const unique_FILE in = open_for_reading(path);
        std::vector<std::uint8_t> data;
        std::uint8_t chunk[64 * 1024];
        std::size_t n;
        while ((n = std::fread(chunk, 1, sizeof(chunk), in.get())) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        if (std::ferror(in.get())) {
            throw IoError("failed to read " + path.string());
        }
        return data;
    }

    void write_new_file(const fs::path& path, const std::vector<std::uint8_t>& bytes) {
        unique_FILE out = create_new_file(path);
        write_all(out.get(), bytes.data(), bytes.size(), path);
        finish_file(out, path);
    }

    void copy_new_file(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        fs::copy_file(from, to, fs::copy_options::none, ec);
        if (ec) {
            if (ec == std::errc::file_exists) {
                throw DestinationExistsError(to);
            }
            throw IoError("cannot copy " + from.string() + " to " + to.string() + ": " + ec.message());
        }
    }

    bool copy_if_absent(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        const bool copied = fs::copy_file(from, to, fs::copy_options::skip_existing, ec);
        if (ec) {
            throw IoError("cannot copy " + from.string() + " to " + to.string() + ": " + ec.message());
        }
        return copied;
    }

} // namespace squisher
