#ifndef WEBOS_VERSION_HPP
#define WEBOS_VERSION_HPP

#include <string>

namespace webos
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace webos

#endif // WEBOS_VERSION_HPP
