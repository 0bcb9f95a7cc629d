#include "toonfetch/errors.hpp"

#include <cerrno>

namespace toonfetch {

bool ArchiveWriteError::isResourceExhaustion() const noexcept {
    if (code_.category() != std::generic_category() && code_.category() != std::system_category()) {
        return false;
    }
    switch (code_.value()) {
    case ENOSPC:
    case EDQUOT:
    case EMFILE:
    case ENFILE:
        return true;
    default:
        return false;
    }
}

} // namespace toonfetch
