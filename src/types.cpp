#include "types.hpp"

BaseError::BaseError(const std::string& type, const std::string& description)
 : std::runtime_error(type + ": " + description + ".")
{}

StructuralError::StructuralError(const std::string& description)
: BaseError{"Structural error", description}
{
}

TransientError::TransientError(const std::string& description)
: BaseError{"Transient error", description}
{
}
