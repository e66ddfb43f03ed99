#pragma once

namespace prefixtree {

/**
 * @brief Outcome of a prefix tree operation.
 *
 * Every domain failure is a logic or input error; none of them is transient,
 * so callers should not retry. Storage exhaustion is not reported here, it
 * propagates as an exception (std::bad_alloc or std::length_error).
 */
enum class Status {
    Ok,          ///< Operation completed
    BadAddress,  ///< Malformed text, or address and mask widths differ
    NodeBusy,    ///< Insert without overwrite hit an already registered prefix
    NotFound     ///< Delete target is absent
};

/**
 * @brief Human readable name of a status.
 * @param status The status to describe
 * @return Static, null-terminated description
 */
inline const char* to_string(Status status) {
    switch (status) {
        case Status::Ok:         return "Ok";
        case Status::BadAddress: return "Bad IP address or mask";
        case Status::NodeBusy:   return "Node busy";
        case Status::NotFound:   return "No such node";
    }
    return "Unknown status";
}

} // namespace prefixtree
