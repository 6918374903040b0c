#ifndef BROOTFILE_TYPES_HPP
#define BROOTFILE_TYPES_HPP

/// \file types.hpp
/// \brief Useful types, constants and utility functions

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/// Base exception type
class BaseError : public std::runtime_error
{
public:
    /// Constructor
    explicit BaseError(const std::string& type, const std::string& description);
};

/// \brief Exception thrown when the target artifact cannot be used at all
///
/// Raised while preparing a validator (the run does not start) or by a validator
/// during a run, in which case it ends the worker that hit it.
class StructuralError : public BaseError
{
public:
    /// Constructor
    explicit StructuralError(const std::string& description);
};

/// \brief Exception thrown by a validator when a single attempt could not be carried out
///
/// The candidate is counted as not matching and the search goes on.
class TransientError : public BaseError
{
public:
    /// Constructor
    explicit TransientError(const std::string& description);
};

// utility functions

/// \return the least significant byte of x
constexpr auto lsb(std::uint32_t x) -> std::uint8_t
{
    return x;
}

/// \return the most significant byte of x
constexpr auto msb(std::uint32_t x) -> std::uint8_t
{
    return x >> 24;
}

// constants

/// Constant value for bit masking
template <int begin, int end>
constexpr auto mask = std::uint32_t{~0u << begin & ~0u >> (32 - end)};

#endif // BROOTFILE_TYPES_HPP
