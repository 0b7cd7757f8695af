#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> type alias for service-level error handling.

#include "gk/core/result.hpp"
#include "gk/foundation/service_error.hpp"

namespace gk::foundation {

/// Result type specialized with ServiceError.
///
/// Every store, codec and flow method that can fail returns ServiceResult<T>
/// instead of throwing exceptions.
///
/// Example:
/// @code
///   ServiceResult<UserRecord> load(UserId id) {
///       auto user = repo.findById(id);
///       if (!user) {
///           return ServiceResult<UserRecord>::err(
///               ServiceError(ErrorCode::RecordNotFound, "no such user"));
///       }
///       return ServiceResult<UserRecord>::ok(*user);
///   }
/// @endcode
template <typename T>
using ServiceResult = gk::Result<T, ServiceError>;

}  // namespace gk::foundation
