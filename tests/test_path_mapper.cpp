#include <cassert>
#include <iostream>
#include <set>
#include "../libsquisher/include/artifact.hpp"
#include "../libsquisher/include/errors.hpp"
#include "../libsquisher/include/path_mapper.hpp"

using namespace squisher;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Mirroring relative paths..." << std::endl;
    const PathMapper mapper("out");
    assert(mapper.map(fs::path("a/b/c.txt")) == fs::path("out/a/b/c.txt"));
    assert(mapper.map(fs::path("top.css")) == fs::path("out/top.css"));

    bool threw = false;
    try {
        (void)mapper.map(fs::absolute("x.txt"));
    } catch (const PathError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[Test] Codec and variant suffixes..." << std::endl;
    assert(PathMapper::with_codec("out/a/b.txt", "br") == fs::path("out/a/b.txt.br"));
    assert(PathMapper::with_codec("out/a/b.txt", "zz") == fs::path("out/a/b.txt.zz"));
    assert(PathMapper::variant("out/a/photo.png", std::nullopt, "webp") == fs::path("out/a/photo.webp"));
    assert(PathMapper::variant("out/a/photo.png", "small", "jpeg") == fs::path("out/a/photo-small.jpeg"));
    assert(PathMapper::variant("out/photo.tar.png", "large", "avif") == fs::path("out/photo.tar-large.avif"));

    std::cout << "[Test] Artifact paths of one file are distinct..." << std::endl;
    std::set<fs::path> seen;
    const fs::path dest = mapper.map(fs::path("img/photo.png"));
    for (const std::optional<std::string_view> tier : {std::optional<std::string_view>{}, std::optional<std::string_view>{"small"},
                                                       std::optional<std::string_view>{"medium"}, std::optional<std::string_view>{"large"}}) {
        for (const char* ext : {"webp", "avif", "jpeg", "png"}) {
            assert(seen.insert(PathMapper::variant(dest, tier, ext)).second);
        }
    }
    assert(seen.size() == 16);

    std::cout << "[Test] SourceFile relative paths..." << std::endl;
    const SourceFile source = SourceFile::from("in", "in/css/site.css");
    assert(source.relative_path == fs::path("css/site.css"));
    assert(source.absolute_path.is_absolute());

    threw = false;
    try {
        (void)SourceFile::from("in", "elsewhere/file.txt");
    } catch (const PathError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::Path);
    }
    assert(threw);

    std::cout << "[Test] PASSED" << std::endl;
    return 0;
}
