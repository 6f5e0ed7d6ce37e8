
#include "reader.hpp"
#include "file.hpp"

std::string Reader::FailureMessage(const std::string& marker_text, const std::string& resolved_path) {
    return "Could not read template file " + marker_text + " (" + resolved_path + ")";
}

std::string Reader::Disk_::operator()(const std::string& base_dir,
                                      const std::string& relative_path,
                                      const std::string& marker_text) const {
    const std::string target = File::Join(base_dir, relative_path);
    std::string retval;
    REQUIRE(File::Slurp(target, &retval), FailureMessage(marker_text, target));
    return retval;
}

std::string Reader::Memory_::operator()(const std::string& base_dir,
                                        const std::string& relative_path,
                                        const std::string& marker_text) const {
    const std::string target = File::Join(base_dir, relative_path);
    auto pf = files_.find(target);
    REQUIRE(pf != files_.end(), FailureMessage(marker_text, target));
    return pf->second;
}
