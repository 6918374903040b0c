#ifndef BROOTFILE_VALIDATOR_HPP
#define BROOTFILE_VALIDATOR_HPP

#include "Target.hpp"

/// \file Validator.hpp

/// \brief Format-specific capability to unlock a target with a password candidate
///
/// A validator is prepared for one target by ValidatorRegistry::resolve and then called
/// concurrently by all workers. Implementations must not modify shared state in attempt().
class Validator
{
public:
    virtual ~Validator() = default;

    /// \brief Try to unlock the target with the given candidate
    /// \return true if the candidate unlocks the target, false otherwise
    /// \exception TransientError if this attempt could not be carried out
    /// \exception StructuralError if the target cannot be unlocked by any candidate
    virtual auto attempt(const std::string& candidate, const Target& target) const -> bool = 0;
};

#endif // BROOTFILE_VALIDATOR_HPP
