#include <cassert>
#include <iostream>
#include "../libsquisher/include/image_buffer.hpp"
#include "test_utils.hpp"

using namespace squisher;

int main() {
    std::cout << "[Test] fit_within keeps aspect ratio and never upscales..." << std::endl;
    assert(fit_within(600, 300, 256) == std::make_pair(256u, 128u));
    assert(fit_within(600, 300, 512) == std::make_pair(512u, 256u));
    assert(fit_within(600, 300, 1024) == std::make_pair(600u, 300u));
    assert(fit_within(300, 600, 256) == std::make_pair(128u, 256u));
    assert(fit_within(256, 256, 256) == std::make_pair(256u, 256u));
    assert(fit_within(10000, 1, 100) == std::make_pair(100u, 1u));

    std::cout << "[Test] Box-filter downscale..." << std::endl;
    const ImageBuffer src = test_utils::gradient(600, 300, true);
    const ImageBuffer small = resize_to_fit(src, 256);
    assert(small.width == 256 && small.height == 128);
    assert(small.has_alpha);
    assert(small.pixels.size() == small.stride() * small.height);

    const ImageBuffer same = resize_to_fit(src, 1024);
    assert(same.width == 600 && same.height == 300);
    assert(same.pixels == src.pixels);

    std::cout << "[Test] Uniform images stay uniform..." << std::endl;
    ImageBuffer flat;
    flat.width = 90;
    flat.height = 30;
    flat.pixels.assign(flat.stride() * flat.height, 0);
    for (std::size_t i = 0; i < flat.pixels.size(); i += 4) {
        flat.pixels[i] = 10;
        flat.pixels[i + 1] = 200;
        flat.pixels[i + 2] = 33;
        flat.pixels[i + 3] = 255;
    }
    const ImageBuffer flat_small = resize_to_fit(flat, 7);
    assert(flat_small.width == 7 && flat_small.height == 2);
    for (std::size_t i = 0; i < flat_small.pixels.size(); i += 4) {
        assert(flat_small.pixels[i] == 10);
        assert(flat_small.pixels[i + 1] == 200);
        assert(flat_small.pixels[i + 2] == 33);
        assert(flat_small.pixels[i + 3] == 255);
    }

    std::cout << "[Test] RGB packing drops alpha..." << std::endl;
    const auto rgb = test_utils::gradient(4, 2, true).to_rgb();
    assert(rgb.size() == 4 * 2 * 3);

    std::cout << "[Test] PASSED" << std::endl;
    return 0;
}
