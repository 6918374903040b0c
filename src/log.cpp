#include "log.hpp"

#include "Target.hpp"

#include <ctime>
#include <iomanip>

auto put_time(std::ostream& os) -> std::ostream&
{
    const std::time_t t = std::time(nullptr);
    return os << std::put_time(std::localtime(&t), "%T");
}

auto operator<<(std::ostream& os, FormatKind kind) -> std::ostream&
{
    return os << getFormatName(kind);
}
