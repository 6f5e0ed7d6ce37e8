#include "file.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>

namespace fs = std::filesystem;

std::string File::Join(const std::string& dir, const std::string& path) {
    return (fs::path(dir) / fs::path(path)).generic_string();
}

std::string File::Parent(const std::string& filename) { return fs::path(filename).parent_path().generic_string(); }

std::string File::Relative(const std::string& path, const std::string& base) {
    return fs::path(path).lexically_relative(fs::path(base)).generic_string();
}

bool File::IsInside(const std::string& path, const std::string& dir) {
    if (dir.empty())
        return false;
    const std::string rel = fs::weakly_canonical(path).lexically_relative(fs::weakly_canonical(dir)).generic_string();
    return !rel.empty() && rel != ".." && rel.compare(0, 3, "../") != 0;
}

bool File::Slurp(const std::string& filename, std::string* dst) {
    std::error_code ec;
    if (!fs::is_regular_file(filename, ec))
        return false;
    std::ifstream src(filename, std::ios::binary);
    if (!src)
        return false;
    dst->assign(std::istreambuf_iterator<char>(src), std::istreambuf_iterator<char>());
    return !src.bad();
}

void File::Write(const std::string& filename, const std::string& content) {
    const fs::path dst(filename);
    if (dst.has_parent_path())
        fs::create_directories(dst.parent_path());
    std::ofstream out(filename, std::ios::binary);
    REQUIRE(out, "Can't open '" + filename + "' for writing");
    out << content;
    REQUIRE(out, "Failed writing '" + filename + "'");
}

std::vector<std::string> File::List(const std::string& dir,
                                    const std::vector<std::string>& patterns,
                                    const std::vector<std::string>& reject_patterns) {
    REQUIRE(fs::is_directory(dir), "Can't scan '" + dir + "': not a directory");
    std::vector<std::regex> filters, rejects;
    for (const auto& p : patterns)
        filters.emplace_back(p);
    for (const auto& p : reject_patterns)
        rejects.emplace_back(p);
    auto matches = [](const std::string& name, const std::regex& r) { return std::regex_match(name, r); };

    std::vector<std::string> ret_val;
    for (fs::recursive_directory_iterator it(dir), endit; it != endit; ++it) {
        if (!it->is_regular_file())
            continue;
        const std::string file_name = it->path().filename().string();
        if (std::none_of(filters.begin(), filters.end(), [&](const std::regex& r) { return matches(file_name, r); }))
            continue;
        if (std::any_of(rejects.begin(), rejects.end(), [&](const std::regex& r) { return matches(file_name, r); }))
            continue;
        ret_val.push_back(it->path().generic_string());
    }
    // directory iteration order is unspecified
    std::sort(ret_val.begin(), ret_val.end());
    return ret_val;
}
