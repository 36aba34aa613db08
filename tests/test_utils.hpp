#ifndef SQUISHER_TEST_UTILS_HPP
#define SQUISHER_TEST_UTILS_HPP

#include "../libsquisher/include/file_utils.hpp"
#include "../libsquisher/include/image_buffer.hpp"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace test_utils {

    /// Hex suffix that keeps concurrent test runs apart.
    inline std::string random_suffix() {
        std::mt19937_64 rng{std::random_device{}()};
        std::ostringstream out;
        out << std::hex << rng();
        return out.str();
    }

    /**
     * @brief Scratch directory under the system temp path, removed on scope exit.
     */
    class ScratchDir {
    public:
        explicit ScratchDir(const std::string& name)
            : root_(std::filesystem::temp_directory_path() / "squisher-test" / (name + "_" + random_suffix())) {
            std::filesystem::create_directories(root_);
        }

        ~ScratchDir() {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
            if (ec) {
                std::cerr << "[Test] cannot remove " << root_.string() << ": " << ec.message() << std::endl;
            }
        }

        ScratchDir(const ScratchDir&) = delete;
        ScratchDir& operator=(const ScratchDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const { return root_; }

        std::filesystem::path operator/(const std::filesystem::path& rel) const { return root_ / rel; }

    private:
        std::filesystem::path root_;
    };

    inline void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
        std::filesystem::create_directories(path.parent_path());
        std::filesystem::remove(path);
        squisher::write_new_file(path, bytes);
    }

    inline void write_text(const std::filesystem::path& path, const std::string& text) {
        write_file(path, std::vector<std::uint8_t>(text.begin(), text.end()));
    }

    /// Deterministic, mildly compressible payload.
    inline std::vector<std::uint8_t> sample_payload(const std::size_t size) {
        std::vector<std::uint8_t> data(size);
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::uint8_t>((i * 31 + (i / 97)) % 251);
        }
        return data;
    }

    /// Horizontal gradient with an alpha ramp when @p alpha is set.
    inline squisher::ImageBuffer gradient(const unsigned width, const unsigned height, const bool alpha) {
        squisher::ImageBuffer img;
        img.width = width;
        img.height = height;
        img.has_alpha = alpha;
        img.pixels.resize(img.stride() * height);
        for (unsigned y = 0; y < height; ++y) {
            for (unsigned x = 0; x < width; ++x) {
                std::uint8_t* p = img.pixels.data() + y * img.stride() + x * 4;
                p[0] = static_cast<std::uint8_t>(x * 255 / (width > 1 ? width - 1 : 1));
                p[1] = static_cast<std::uint8_t>(y * 255 / (height > 1 ? height - 1 : 1));
                p[2] = 128;
                p[3] = alpha ? static_cast<std::uint8_t>(64 + (x % 128)) : 255;
            }
        }
        return img;
    }

} // namespace test_utils

#endif // SQUISHER_TEST_UTILS_HPP
