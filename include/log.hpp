#ifndef BROOTFILE_LOG_HPP
#define BROOTFILE_LOG_HPP

#include <iostream>

/// \file log.hpp
/// \brief Output stream manipulators

/// Insert the current local time into the output stream
auto put_time(std::ostream& os) -> std::ostream&;

enum class FormatKind; // forward declaration

/// \brief Insert the name of a format kind into the stream \a os
auto operator<<(std::ostream& os, FormatKind kind) -> std::ostream&;

#endif // BROOTFILE_LOG_HPP
