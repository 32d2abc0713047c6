#include "platform/environment_detector.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {
fs::path make_scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("teddy-setup-" + name + "-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& contents) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << contents;
}
}

int main() {
    {
        fs::path root = make_scratch_dir("absent");
        fs::remove_all(root);

        DetectionResult result = EnvironmentDetector(root).detect();
        assert(!result.volume_available);
        assert(!result.volume_path.has_value());
        assert(result.taf_file_count == 0);
        assert(result.catalog_entry_count == 0);
        assert(result.image_directory_paths.empty());
    }

    {
        fs::path root = make_scratch_dir("partial");
        fs::create_directories(root / "config");
        write_file(root / "config" / "tonies.custom.json", "[{}, {}]");
        fs::create_directories(root / "www" / "custom_img");

        DetectionResult result = EnvironmentDetector(root).detect();
        assert(!result.volume_available);
        assert(!result.volume_path.has_value());
        assert(result.catalog_entry_count == 0);
        assert(result.image_directory_paths.empty());
        fs::remove_all(root);
    }

    {
        fs::path root = make_scratch_dir("full");
        write_file(root / "config" / "tonies.custom.json", R"([{"no":"1"},{"no":"2"},{"no":"3"}])");
        write_file(root / "library" / "a.taf", "");
        write_file(root / "library" / "box" / "b.taf", "");
        write_file(root / "library" / "box" / "deep" / "c.taf", "");
        write_file(root / "library" / "notes.txt", "");
        write_file(root / "library" / "d.TAF", "");
        fs::create_directories(root / "library" / "folder.taf");
        fs::create_directories(root / "library" / "own" / "pics");
        fs::create_directories(root / "www" / "custom_img");

        DetectionResult result = EnvironmentDetector(root).detect();
        assert(result.volume_available);
        assert(result.volume_path == root.string());
        assert(result.taf_file_count == 3);
        assert(result.catalog_entry_count == 3);
        assert(result.image_directory_paths.size() == 2);
        assert(result.image_directory_paths[0] == (root / "library" / "own" / "pics").string());
        assert(result.image_directory_paths[1] == (root / "www" / "custom_img").string());

        DetectionResult again = EnvironmentDetector(root).detect();
        assert(again.taf_file_count == result.taf_file_count);
        assert(again.image_directory_paths == result.image_directory_paths);
        fs::remove_all(root);
    }

    {
        fs::path root = make_scratch_dir("object-catalog");
        write_file(root / "config" / "tonies.custom.json", R"({"a": 1, "b": 2})");
        write_file(root / "library" / "x.taf", "");
        fs::create_directories(root / "www" / "custom_img");

        DetectionResult result = EnvironmentDetector(root).detect();
        assert(result.volume_available);
        assert(result.catalog_entry_count == 0);
        assert(result.taf_file_count == 1);
        assert(result.image_directory_paths.size() == 1);
        assert(result.image_directory_paths[0] == (root / "www" / "custom_img").string());
        fs::remove_all(root);
    }

    {
        fs::path root = make_scratch_dir("broken-catalog");
        write_file(root / "config" / "tonies.custom.json", "[{\"unterminated\": ");
        write_file(root / "library" / "x.taf", "");

        DetectionResult result = EnvironmentDetector(root).detect();
        assert(result.volume_available);
        assert(result.catalog_entry_count == 0);
        assert(result.taf_file_count == 1);
        assert(result.image_directory_paths.empty());
        fs::remove_all(root);
    }

    {
        fs::path root = make_scratch_dir("helpers");
        assert(!detection::count_catalog_entries(root / "missing.json").has_value());
        assert(!detection::count_files_with_extension(root / "missing", ".taf").has_value());
        write_file(root / "empty.json", "[]");
        assert(detection::count_catalog_entries(root / "empty.json") == std::optional<std::size_t>(0));
        fs::remove_all(root);
    }

    return 0;
}
