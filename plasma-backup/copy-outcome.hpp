#ifndef PLASMA_BACKUP_COPY_OUTCOME_HPP_INCLUDED
#define PLASMA_BACKUP_COPY_OUTCOME_HPP_INCLUDED
//
// copy-outcome.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"

#include <cstddef>

namespace plasma_backup
{

    // One of these for every decision the TreeCopier makes about an entry.
    struct CopyOutcome
    {
        Outcome outcome = Outcome::Copied;
        fs::path source;
        fs::path destination;
        std::size_t bytes = 0;

        // both only set when an error caused the skip
        ErrorKind error_kind = ErrorKind::None;
        ErrorCode_t error_code;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_COPY_OUTCOME_HPP_INCLUDED
