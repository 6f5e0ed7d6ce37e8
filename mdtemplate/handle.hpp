#pragma once

// sort of using this as a platform file
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#define REQUIRE(cond, msg)                                                                                             \
    if (cond)                                                                                                          \
        ;                                                                                                              \
    else                                                                                                               \
        throw std::runtime_error(std::string(msg).c_str())
#define THROW(msg) throw std::runtime_error(std::string(msg).c_str());
template <class T_> T_ Next(const T_& p) { return p + 1; }

std::string EnvironmentValue(const std::string& name);
// replaces each $(NAME) with the value of that environment variable
std::string WithEnvironment(const std::string& src);
