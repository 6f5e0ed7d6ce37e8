
#include "handle.hpp"
#include <cstdlib>


std::string EnvironmentValue(const std::string& name) {
#if defined(_MSC_VER)
    std::string retval;
    char* temp;
    size_t sz;
    if (_dupenv_s(&temp, &sz, name.c_str()) != 0 || !temp)
        THROW("Can't find '" + name + "' in environment");
    retval = temp;
    free(temp);
    return retval;
#else
    char* ret = getenv(name.c_str());
    REQUIRE(ret, "Can't find '" + name + "' in environment");
    return std::string(ret);
#endif
}

namespace {
    std::string AddEnvironment(const std::string& src, size_t offset, const std::string& so_far) {
        auto start = src.find("$(", offset);
        if (start == std::string::npos)
            return so_far + src.substr(offset);
        const std::string before = src.substr(offset, start - offset);
        start += 2;
        auto stop = src.find(')', start);
        REQUIRE(stop != std::string::npos, "Non-terminated environment variable");
        return AddEnvironment(src, stop + 1, so_far + before + EnvironmentValue(src.substr(start, stop - start)));
    }
} // namespace

std::string WithEnvironment(const std::string& src) { return AddEnvironment(src, 0, std::string()); }
